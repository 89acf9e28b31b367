#include "core/tombstone.hpp"

namespace tagsync {

std::string TombstoneKey::to_string() const {
    std::string out(entity_kind_name(kind));
    out += ':';
    out += id;
    return out;
}

std::optional<TombstoneKey> TombstoneKey::parse(std::string_view text) {
    const auto sep = text.find(':');
    if (sep == std::string_view::npos || sep + 1 >= text.size()) {
        return std::nullopt;
    }
    auto kind = parse_entity_kind(text.substr(0, sep));
    if (!kind) {
        return std::nullopt;
    }
    return TombstoneKey{.kind = *kind, .id = std::string(text.substr(sep + 1))};
}

bool TombstoneLedger::record_deletion(EntityKind kind, std::string id) {
    return keys_.insert(TombstoneKey{.kind = kind, .id = std::move(id)}).second;
}

bool TombstoneLedger::clear_deletion(EntityKind kind, const std::string& id) {
    return keys_.erase(TombstoneKey{.kind = kind, .id = id}) > 0;
}

bool TombstoneLedger::is_pending(EntityKind kind, const std::string& id) const {
    return keys_.contains(TombstoneKey{.kind = kind, .id = id});
}

std::vector<std::string> TombstoneLedger::ids(EntityKind kind) const {
    std::vector<std::string> out;
    for (const auto& key : keys_) {
        if (key.kind == kind) {
            out.push_back(key.id);
        }
    }
    return out;
}

std::vector<std::string> TombstoneLedger::to_strings() const {
    std::vector<std::string> out;
    out.reserve(keys_.size());
    for (const auto& key : keys_) {
        out.push_back(key.to_string());
    }
    return out;
}

TombstoneLedger TombstoneLedger::from_strings(const std::vector<std::string>& entries,
                                              std::vector<std::string>* rejected) {
    TombstoneLedger ledger;
    for (const auto& entry : entries) {
        if (auto key = TombstoneKey::parse(entry)) {
            ledger.keys_.insert(std::move(*key));
        } else if (rejected) {
            rejected->push_back(entry);
        }
    }
    return ledger;
}

} // namespace tagsync
