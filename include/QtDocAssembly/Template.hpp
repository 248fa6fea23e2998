/** \file Template.hpp
 *  Public façade for loading a DOCX template and performing placeholder replacement.
 *  Processing scope: body content parts (word/document.xml, headers, footers, footnotes,
 *  endnotes). Every other entry is copied through byte-for-byte. Unknown placeholders
 *  are left untouched.
 */
#pragma once
#include "QtDocAssembly/Export.hpp"
#include "QtDocAssembly/Error.hpp"
#include "QtDocAssembly/VariablePattern.hpp"
#include "QtDocAssembly/Placeholders.hpp"
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <memory>
#include <optional>

namespace QtDocAssembly {

// Forward declarations & internal includes
namespace opc { class Package; }

/** Main API entry. Load a template, configure pattern, replace placeholders, and save.
 *  Thread-safety: instances are not thread-safe. One instance per document.
 */
class QTDOCASSEMBLY_EXPORT Template {
public:
    /** Construct with path to an existing .docx template. No I/O until first operation. */
    explicit Template(QString templatePath);
    ~Template();

    /** Construct from in-memory template bytes. */
    static Template fromBytes(const QByteArray &docxBytes);

    /** Override variable pattern (default {{ .. }}). */
    void setVariablePattern(const VariablePattern &pattern);
    /** Current variable pattern in effect. */
    const VariablePattern & variablePattern() const { return m_pattern; }
    /** Return paragraph-joined plain text of the main document (paragraphs separated by \n). */
    QString readTextContent() const;
    /** Placeholder tokens (wrapped form) in order of first appearance, deduplicated.
     *  Spans across run boundaries.
     */
    QStringList findVariables() const;
    /** Substitute placeholders in every body part. Returns false only if the template
     *  could not be opened. Parts that fail to parse keep their original bytes and are
     *  listed in skippedParts(); lastError() then reports XmlPartUnparseable.
     */
    bool fillTemplate(const Placeholders &placeholders);
    /** Parts copied through unchanged during the last fillTemplate because they failed to parse. */
    const QStringList & skippedParts() const { return m_skippedParts; }
    /** Write resulting package to disk (zip). */
    bool save(const QString &outputPath) const;
    /** Resulting package as zip bytes; empty on failure. */
    QByteArray toBytes() const;

    /** True for zip entry names whose XML carries document body text. */
    static bool isTransformablePart(const QString &partName);

    /** Last error set during an operation; std::nullopt if none since the last operation started. */
    const std::optional<Error> & lastError() const { return m_lastError; }
    /** Clear stored error. */
    void clearError() { m_lastError.reset(); }

private:
    Template() = default;

    QString m_templatePath;
    QByteArray m_sourceBytes;
    bool m_fromBytes{false};
    VariablePattern m_pattern;
    mutable std::shared_ptr<opc::Package> m_package; // OPC container (shared_ptr works with incomplete type)
    mutable bool m_openAttempted{false};
    QStringList m_skippedParts;
    bool ensureOpened() const; // lazy open helper
    void setError(ErrorCode ec, const QString &message) const { m_lastError = Error{ec, message, {}}; }

    // Build paragraph-joined text (implementation detail shared by readTextContent & findVariables)
    QString readFullText() const;
    mutable std::optional<Error> m_lastError;
};

} // namespace QtDocAssembly
