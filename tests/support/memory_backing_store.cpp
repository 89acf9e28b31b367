#include "support/memory_backing_store.hpp"

namespace tagsync::testing {

namespace {

Error injected(const char* what) {
    return persistence_error(std::string("injected ") + what + " failure", 10);
}

} // namespace

Res<std::optional<std::string>> MemoryBackingStore::get(const std::string& key) {
    if (fail_reads) return Res<std::optional<std::string>>::err(injected("read"));
    ++reads;
    auto it = values.find(key);
    if (it == values.end()) return Res<std::optional<std::string>>::ok(std::nullopt);
    return Res<std::optional<std::string>>::ok(it->second);
}

Res<std::map<std::string, std::string>> MemoryBackingStore::get_multiple(const std::vector<std::string>& keys) {
    if (fail_reads) return Res<std::map<std::string, std::string>>::err(injected("read"));
    ++reads;
    std::map<std::string, std::string> out;
    for (const auto& key : keys) {
        if (auto it = values.find(key); it != values.end()) {
            out.emplace(key, it->second);
        }
    }
    return Res<std::map<std::string, std::string>>::ok(std::move(out));
}

Res<void> MemoryBackingStore::set(const std::string& key, const std::string& value) {
    if (fail_writes) return Res<void>::err(injected("write"));
    ++writes;
    values.insert_or_assign(key, value);
    return Res<void>::ok();
}

Res<void> MemoryBackingStore::set_multiple(const std::map<std::string, std::string>& entries) {
    if (fail_writes) return Res<void>::err(injected("write"));
    ++writes;
    for (const auto& [key, value] : entries) {
        values.insert_or_assign(key, value);
    }
    return Res<void>::ok();
}

Res<void> MemoryBackingStore::remove(const std::string& key) {
    if (fail_writes) return Res<void>::err(injected("write"));
    ++writes;
    values.erase(key);
    return Res<void>::ok();
}

Res<void> MemoryBackingStore::remove_multiple(const std::vector<std::string>& keys) {
    if (fail_writes) return Res<void>::err(injected("write"));
    ++writes;
    for (const auto& key : keys) {
        values.erase(key);
    }
    return Res<void>::ok();
}

Res<std::vector<std::string>> MemoryBackingStore::keys() {
    if (fail_reads) return Res<std::vector<std::string>>::err(injected("read"));
    std::vector<std::string> out;
    for (const auto& [key, value] : values) {
        out.push_back(key);
    }
    return Res<std::vector<std::string>>::ok(std::move(out));
}

} // namespace tagsync::testing
