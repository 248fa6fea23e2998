#include "opc/Package.hpp"
#include <QFile>
#include <QSaveFile>
#include <miniz.h>

namespace QtDocAssembly { namespace opc {

namespace {

class ZipReaderGuard {
public:
    explicit ZipReaderGuard(mz_zip_archive &archive) : archive_(archive) {}
    ZipReaderGuard(const ZipReaderGuard &) = delete;
    ZipReaderGuard &operator=(const ZipReaderGuard &) = delete;
    ~ZipReaderGuard() { mz_zip_reader_end(&archive_); }
private:
    mz_zip_archive &archive_;
};

class ZipWriterGuard {
public:
    explicit ZipWriterGuard(mz_zip_archive &archive) : archive_(archive) {}
    ZipWriterGuard(const ZipWriterGuard &) = delete;
    ZipWriterGuard &operator=(const ZipWriterGuard &) = delete;
    ~ZipWriterGuard() { mz_zip_writer_end(&archive_); }
private:
    mz_zip_archive &archive_;
};

QString zipErrorText(mz_zip_archive &zip) {
    return QString::fromUtf8(mz_zip_get_error_string(mz_zip_get_last_error(&zip)));
}

} // namespace

bool Package::open(const QString &path) {
    clear();
    QFile f(path);
    if(!f.open(QIODevice::ReadOnly)) {
        m_error = f.errorString();
        return false;
    }
    return openBytes(f.readAll());
}

bool Package::openBytes(const QByteArray &zipBytes) {
    clear();
    if(zipBytes.isEmpty()) { m_error = QStringLiteral("empty archive"); return false; }
    mz_zip_archive zip{};
    if(!mz_zip_reader_init_mem(&zip, zipBytes.constData(), static_cast<size_t>(zipBytes.size()), 0)) {
        m_error = zipErrorText(zip);
        return false;
    }
    ZipReaderGuard guard(zip);
    const mz_uint count = mz_zip_reader_get_num_files(&zip);
    m_entries.reserve(count);
    for(mz_uint i = 0; i < count; ++i) {
        mz_zip_archive_file_stat st;
        if(!mz_zip_reader_file_stat(&zip, i, &st)) {
            m_error = zipErrorText(zip);
            m_entries.clear(); m_index.clear();
            return false;
        }
        Entry e;
        e.name = QString::fromUtf8(st.m_filename);
        e.isDirectory = mz_zip_reader_is_file_a_directory(&zip, i);
        if(!e.isDirectory && st.m_uncomp_size != 0) {
            size_t size = 0;
            void *p = mz_zip_reader_extract_to_heap(&zip, i, &size, 0);
            if(!p) {
                m_error = QStringLiteral("cannot extract %1: %2").arg(e.name, zipErrorText(zip));
                m_entries.clear(); m_index.clear();
                return false;
            }
            e.data = QByteArray(static_cast<const char *>(p), static_cast<int>(size));
            mz_free(p);
        }
        m_index.insert(e.name, m_entries.size());
        m_entries.push_back(std::move(e));
    }
    return true;
}

QStringList Package::partNames() const {
    QStringList names;
    for(const auto &e : m_entries) if(!e.isDirectory) names << e.name;
    return names;
}

std::optional<QByteArray> Package::readPart(const QString &name) const {
    auto it = m_index.constFind(name);
    if(it == m_index.constEnd()) return std::nullopt;
    const Entry &e = m_entries[it.value()];
    if(e.isDirectory) return std::nullopt;
    return e.data;
}

void Package::writePart(const QString &name, const QByteArray &data) {
    auto it = m_index.constFind(name);
    if(it != m_index.constEnd()) {
        m_entries[it.value()].data = data;
        return;
    }
    m_index.insert(name, m_entries.size());
    m_entries.push_back(Entry{name, data, false});
}

QByteArray Package::saveToBytes() const {
    m_error.clear();
    mz_zip_archive zip{};
    if(!mz_zip_writer_init_heap(&zip, 0, 0)) {
        m_error = zipErrorText(zip);
        return {};
    }
    ZipWriterGuard guard(zip);
    for(const auto &e : m_entries) {
        const QByteArray name = e.name.toUtf8();
        const mz_bool ok = e.isDirectory
            ? mz_zip_writer_add_mem(&zip, name.constData(), nullptr, 0, MZ_NO_COMPRESSION)
            : mz_zip_writer_add_mem(&zip, name.constData(), e.data.constData(), static_cast<size_t>(e.data.size()), MZ_DEFAULT_COMPRESSION);
        if(!ok) {
            m_error = QStringLiteral("cannot add %1: %2").arg(e.name, zipErrorText(zip));
            return {};
        }
    }
    void *buf = nullptr; size_t size = 0;
    if(!mz_zip_writer_finalize_heap_archive(&zip, &buf, &size)) {
        m_error = zipErrorText(zip);
        return {};
    }
    QByteArray out(static_cast<const char *>(buf), static_cast<int>(size));
    mz_free(buf);
    return out;
}

bool Package::saveAs(const QString &path) const {
    QByteArray bytes = saveToBytes();
    if(bytes.isEmpty()) return false;
    QSaveFile f(path);
    if(!f.open(QIODevice::WriteOnly)) { m_error = f.errorString(); return false; }
    if(f.write(bytes) != bytes.size()) { m_error = f.errorString(); f.cancelWriting(); return false; }
    if(!f.commit()) { m_error = f.errorString(); return false; }
    return true;
}

}} // namespace QtDocAssembly::opc
