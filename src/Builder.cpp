#include "QtDocAssembly/Builder.hpp"

namespace QtDocAssembly {

Placeholders makePlaceholders(std::initializer_list<PlaceholderSpec> specs){
    Placeholders p;
    for(const auto &s : specs) p.add(s.keyOrName, s.value);
    return p;
}

Placeholders placeholdersFromRecord(const QHash<QString, QString> &record){
    Placeholders p;
    for(auto it = record.cbegin(); it != record.cend(); ++it){
        if(!Placeholders::isValidKey(it.key())) continue;
        p.add(it.key(), it.value().trimmed());
    }
    return p;
}

} // namespace QtDocAssembly
