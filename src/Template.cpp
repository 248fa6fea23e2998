#include "QtDocAssembly/Template.hpp"
#include <QFileInfo>
#include <QSet>
#include "opc/Package.hpp"
#include "xml/XmlPart.hpp"
#include "engine/PatternCache.hpp"
#include "engine/Replacers.hpp"
#include "util/Logging.hpp"
#include <QRegularExpression>

namespace QtDocAssembly {

namespace {
const QRegularExpression &bodyPartPattern() {
    static const QRegularExpression re(QStringLiteral("^word/(document|header\\d*|footer\\d*|footnotes|endnotes)\\.xml$"),
                                       QRegularExpression::CaseInsensitiveOption);
    return re;
}
} // namespace

bool Template::isTransformablePart(const QString &partName) {
    return bodyPartPattern().match(partName).hasMatch();
}

bool Template::ensureOpened() const {
    if(m_openAttempted) return m_package != nullptr;
    m_openAttempted = true;
    auto pkg = std::make_shared<opc::Package>();
    if(m_fromBytes) {
        if(!pkg->openBytes(m_sourceBytes)) {
            setError(ErrorCode::MalformedContainer, QStringLiteral("template is not a zip package: %1").arg(pkg->errorString()));
            return false;
        }
    } else {
        QFileInfo fi(m_templatePath);
        if(!fi.exists() || !fi.isFile()) {
            setError(ErrorCode::TemplateNotFound, QStringLiteral("template not found: %1").arg(fi.fileName()));
            return false;
        }
        if(!pkg->open(m_templatePath)) {
            setError(ErrorCode::MalformedContainer, QStringLiteral("cannot open template %1: %2").arg(fi.fileName(), pkg->errorString()));
            return false;
        }
    }
    m_package = std::move(pkg);
    return true;
}

QString Template::readFullText() const {
    if(!ensureOpened()) return {};
    // Load document.xml
    auto dataOpt = m_package->readPart("word/document.xml");
    if(!dataOpt) { setError(ErrorCode::MalformedContainer, QStringLiteral("word/document.xml missing")); return {}; }
    xml::XmlPart part;
    if(!part.load(*dataOpt)) { setError(ErrorCode::XmlPartUnparseable, QStringLiteral("word/document.xml: %1").arg(part.errorDescription())); return {}; }
    QStringList paragraphLines;
    for(const auto &p : part.selectAll("//w:p")) {
        QString paraText;
        // Collect all descendant w:t in order
        pugi::xpath_query textQuery(".//w:t");
        for(const auto &tn : textQuery.evaluate_node_set(p)) {
            paraText += QString::fromUtf8(tn.node().text().get());
        }
        paragraphLines << paraText;
    }
    return paragraphLines.join('\n');
}

Template::Template(QString templatePath)
    : m_templatePath(std::move(templatePath)) {}

Template::~Template() = default;

Template Template::fromBytes(const QByteArray &docxBytes) {
    Template t;
    t.m_sourceBytes = docxBytes;
    t.m_fromBytes = true;
    return t;
}

void Template::setVariablePattern(const VariablePattern &pattern) {
    m_pattern = pattern;
}

QString Template::readTextContent() const {
    return readFullText();
}

QStringList Template::findVariables() const {
    QString text = readFullText();
    if(text.isEmpty()) return {};
    QRegularExpression re = engine::PatternCache::instance().anyPlaceholderPattern(m_pattern);
    QStringList found;
    QSet<QString> seen;
    auto it = re.globalMatch(text);
    while(it.hasNext()) {
        QString token = m_pattern.prefix + it.next().captured(1) + m_pattern.suffix;
        if(!seen.contains(token)) {
            seen.insert(token);
            found << token;
        }
    }
    return found;
}

bool Template::fillTemplate(const Placeholders &placeholders) {
    clearError();
    m_skippedParts.clear();
    if(!ensureOpened()) return false;
    if(!m_package->hasPart("word/document.xml")) {
        qCWarning(lcTemplate) << "Template: word/document.xml missing; filling remaining body parts";
    }
    int total = 0;
    for(const auto &partName : m_package->partNames()) {
        if(!isTransformablePart(partName)) continue;
        auto dataOpt = m_package->readPart(partName);
        if(!dataOpt) continue;
        engine::PartRewrite r = engine::Replacers::rewritePart(*dataOpt, placeholders, m_pattern);
        if(!r.parsed) {
            qCWarning(lcTemplate) << "Template: keeping" << partName << "unchanged, XML parse failed:" << r.parseError;
            m_skippedParts << partName;
            setError(ErrorCode::XmlPartUnparseable, QStringLiteral("%1: %2").arg(partName, r.parseError));
            continue;
        }
        if(r.replacements > 0) {
            m_package->writePart(partName, r.bytes);
            total += r.replacements;
        }
    }
    qCDebug(lcTemplate) << "Template: substituted" << total << "placeholder occurrence(s)";
    return true;
}

QByteArray Template::toBytes() const {
    if(!ensureOpened()) return {};
    QByteArray out = m_package->saveToBytes();
    if(out.isEmpty()) setError(ErrorCode::IoFailed, QStringLiteral("cannot serialize template: %1").arg(m_package->errorString()));
    return out;
}

bool Template::save(const QString &outputPath) const {
    if(!ensureOpened()) return false;
    if(!m_package->saveAs(outputPath)) {
        setError(ErrorCode::IoFailed, QStringLiteral("cannot write %1: %2").arg(QFileInfo(outputPath).fileName(), m_package->errorString()));
        return false;
    }
    return true;
}

} // namespace QtDocAssembly
