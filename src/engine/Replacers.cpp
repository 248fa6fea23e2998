#include "engine/Replacers.hpp"
#include "engine/PatternCache.hpp"
#include "engine/RunRewriter.hpp"
#include "xml/XmlPart.hpp"
#include <QRegularExpression>

namespace QtDocAssembly { namespace engine {

std::vector<PlaceholderMatch> Replacers::findPlaceholders(const QString &text, const Placeholders &values, const VariablePattern &pattern) {
	std::vector<PlaceholderMatch> found;
	if(values.isEmpty() || !text.contains(pattern.prefix)) return found;
	QRegularExpression re = PatternCache::instance().anyPlaceholderPattern(pattern);
	auto it = re.globalMatch(text);
	while(it.hasNext()) {
		auto m = it.next();
		const QString key = m.captured(1);
		if(!values.contains(key)) continue; // unknown: left as written
		found.push_back(PlaceholderMatch{m.capturedStart(0), m.capturedEnd(0), values.value(key)});
	}
	return found;
}

int Replacers::substitute(QString &text, const Placeholders &values, const VariablePattern &pattern) {
	const std::vector<PlaceholderMatch> found = findPlaceholders(text, values, pattern);
	if(found.empty()) return 0;
	QString out; out.reserve(text.size());
	qsizetype last = 0;
	for(const PlaceholderMatch &m : found) {
		out += text.mid(last, m.start - last);
		out += m.value;
		last = m.end;
	}
	out += text.mid(last);
	text = out;
	return static_cast<int>(found.size());
}

int Replacers::replaceText(pugi::xml_document &doc, const Placeholders &values, const VariablePattern &pattern) {
	if(values.isEmpty()) return 0;
	return RunRewriter::rewrite(doc, values, pattern);
}

PartRewrite Replacers::rewritePart(const QByteArray &xmlBytes, const Placeholders &values, const VariablePattern &pattern) {
	PartRewrite result;
	result.bytes = xmlBytes;
	xml::XmlPart part;
	if(!part.load(xmlBytes)) {
		// never emit possibly-corrupt XML: keep the original part
		result.parsed = false;
		result.parseError = part.errorDescription();
		return result;
	}
	result.replacements = replaceText(part.doc(), values, pattern);
	if(result.replacements > 0) result.bytes = part.save();
	return result;
}

}} // namespace QtDocAssembly::engine
