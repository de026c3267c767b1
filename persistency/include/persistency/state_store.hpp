#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <log.hpp>
#include <presence/core/scheduler.hpp>
#include <presence/per/document_storage.hpp>

namespace presence::persistency {

struct EntityRecord {
    std::string id;
    std::string display_name;
    std::optional<std::string> state;  // nullopt => offline / no location
    core::WallClock::time_point updated_at{};
};

struct Transition {
    bool changed{false};
    std::optional<std::string> previous;
    std::optional<std::string> current;
};

// Last-known state per entity with debounced write-behind.
//
// All calls must come from the scheduler's thread. Every mutation restarts a
// single debounce timer; the document is written only when the timer fires
// or on Flush().
class StateStore {
public:
    struct Config {
        std::chrono::milliseconds debounce{1000};
    };

    // Loads the document immediately; a missing, unreadable or malformed
    // document leaves the store empty.
    StateStore(per::DocumentStorage& storage, core::Scheduler& scheduler, Config cfg);
    StateStore(per::DocumentStorage& storage, core::Scheduler& scheduler)
        : StateStore(storage, scheduler, Config{}) {}
    ~StateStore();

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    Transition Update(const std::string& id, const std::string& display_name,
                      const std::optional<std::string>& new_state);

    // Seeds state without comparing; used by startup reconciliation only.
    void SetInitial(const std::string& id, const std::string& display_name,
                    const std::optional<std::string>& state);

    // No-op when the id is unknown.
    void UpdateDisplayName(const std::string& id, const std::string& display_name);

    std::optional<EntityRecord> GetRecord(const std::string& id) const;
    std::optional<std::string> GetDisplayName(const std::string& id) const;
    std::size_t Size() const noexcept { return records_.size(); }

    // Cancels the pending debounce and writes synchronously.
    void Flush();

    bool PersistPending() const noexcept { return save_timer_ != core::kNoTimer; }
    std::uint64_t PersistCount() const noexcept { return persist_count_; }

private:
    void Load();
    void ScheduleSave();
    void SaveNow();
    std::string Serialize() const;

    per::DocumentStorage& storage_;
    core::Scheduler& scheduler_;
    Config cfg_;
    std::map<std::string, EntityRecord> records_;
    core::TimerId save_timer_{core::kNoTimer};
    std::uint64_t persist_count_{0};
    log::Logger log_;
};

} // namespace presence::persistency
