#pragma once

#include "storage/backing_store.hpp"
#include <map>
#include <string>

namespace tagsync::testing {

/**
 * In-memory BackingStore that counts calls and can be told to fail.
 */
class MemoryBackingStore final : public storage::BackingStore {
public:
    [[nodiscard]] Res<std::optional<std::string>> get(const std::string& key) override;
    [[nodiscard]] Res<std::map<std::string, std::string>> get_multiple(
        const std::vector<std::string>& keys) override;
    [[nodiscard]] Res<void> set(const std::string& key, const std::string& value) override;
    [[nodiscard]] Res<void> set_multiple(const std::map<std::string, std::string>& entries) override;
    [[nodiscard]] Res<void> remove(const std::string& key) override;
    [[nodiscard]] Res<void> remove_multiple(const std::vector<std::string>& keys) override;
    [[nodiscard]] Res<std::vector<std::string>> keys() override;

    // Number of successful write calls (set, set_multiple, remove, remove_multiple).
    int writes = 0;
    int reads = 0;
    bool fail_writes = false;
    bool fail_reads = false;

    std::map<std::string, std::string> values;
};

} // namespace tagsync::testing
