#include <persistency/state_store.hpp>
#include <nlohmann/json.hpp>
#include <presence/core/iso_time.hpp>

using nlohmann::json;

namespace presence::persistency {

namespace {

// "entities" must be an object; the rest of the document is ignored
bool IsValidSnapshot(const json& doc) {
    return doc.is_object() && doc.contains("entities") && doc["entities"].is_object();
}

std::optional<EntityRecord> RecordFromJson(const std::string& key, const json& j) {
    if (!j.is_object()) return std::nullopt;
    if (!j.contains("displayName") || !j["displayName"].is_string()) return std::nullopt;

    EntityRecord rec;
    rec.id = j.value("id", key);
    if (rec.id != key) return std::nullopt;
    rec.display_name = j["displayName"].get<std::string>();

    if (j.contains("state")) {
        const auto& s = j["state"];
        if (s.is_string())    rec.state = s.get<std::string>();
        else if (!s.is_null()) return std::nullopt;
    }
    if (j.contains("updatedAt") && j["updatedAt"].is_string()) {
        if (auto t = core::ParseIso8601(j["updatedAt"].get<std::string>())) rec.updated_at = *t;
    }
    return rec;
}

} // namespace

StateStore::StateStore(per::DocumentStorage& storage, core::Scheduler& scheduler, Config cfg)
    : storage_(storage), scheduler_(scheduler), cfg_(cfg),
      log_(log::Logger::CreateLogger("STORE")) {
    Load();
}

StateStore::~StateStore() {
    if (save_timer_ != core::kNoTimer) scheduler_.Cancel(save_timer_);
}

void StateStore::Load() {
    records_.clear();

    auto raw = storage_.Read();
    if (!raw.HasValue()) {
        if (raw.Error().value == core::Errc::kNotFound) {
            PRESENCE_LOGINFO(log_, "No snapshot at {}, starting empty", storage_.Path());
        } else {
            PRESENCE_LOGERROR(log_, "Failed to read snapshot: {}", raw.Error().Describe());
        }
        return;
    }

    json doc = json::parse(raw.Value(), nullptr, /*allow_exceptions*/ false);
    if (doc.is_discarded() || !IsValidSnapshot(doc)) {
        PRESENCE_LOGWARN(log_, "Invalid snapshot structure in {}, starting empty", storage_.Path());
        return;
    }

    for (const auto& [key, value] : doc["entities"].items()) {
        auto rec = RecordFromJson(key, value);
        if (!rec) {
            PRESENCE_LOGWARN(log_, "Skipping malformed record '{}'", key);
            continue;
        }
        records_.emplace(key, std::move(*rec));
    }
    PRESENCE_LOGINFO(log_, "Loaded {} entit(ies) from {}", records_.size(), storage_.Path());
}

Transition StateStore::Update(const std::string& id, const std::string& display_name,
                              const std::optional<std::string>& new_state) {
    std::optional<std::string> previous;
    auto it = records_.find(id);
    if (it != records_.end()) previous = it->second.state;

    if (previous == new_state) {
        return Transition{false, previous, new_state};
    }

    records_[id] = EntityRecord{id, display_name, new_state, scheduler_.Now()};
    ScheduleSave();
    return Transition{true, previous, new_state};
}

void StateStore::SetInitial(const std::string& id, const std::string& display_name,
                            const std::optional<std::string>& state) {
    records_[id] = EntityRecord{id, display_name, state, scheduler_.Now()};
    ScheduleSave();
}

void StateStore::UpdateDisplayName(const std::string& id, const std::string& display_name) {
    auto it = records_.find(id);
    if (it == records_.end()) return;
    it->second.display_name = display_name;
    ScheduleSave();
}

std::optional<EntityRecord> StateStore::GetRecord(const std::string& id) const {
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> StateStore::GetDisplayName(const std::string& id) const {
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second.display_name;
}

void StateStore::ScheduleSave() {
    if (save_timer_ != core::kNoTimer) scheduler_.Cancel(save_timer_);
    save_timer_ = scheduler_.ScheduleAfter(cfg_.debounce, [this] {
        save_timer_ = core::kNoTimer;
        SaveNow();
    });
}

void StateStore::Flush() {
    if (save_timer_ != core::kNoTimer) {
        scheduler_.Cancel(save_timer_);
        save_timer_ = core::kNoTimer;
    }
    SaveNow();
}

std::string StateStore::Serialize() const {
    json entities = json::object();
    for (const auto& [id, rec] : records_) {
        entities[id] = {
            {"id", rec.id},
            {"displayName", rec.display_name},
            {"state", rec.state ? json(*rec.state) : json(nullptr)},
            {"updatedAt", core::FormatIso8601(rec.updated_at)},
        };
    }
    return json{{"entities", std::move(entities)}}.dump(2);
}

void StateStore::SaveNow() {
    auto r = storage_.Write(Serialize());
    if (!r.HasValue()) {
        PRESENCE_LOGERROR(log_, "Failed to save snapshot: {}", r.Error().Describe());
        return;
    }
    ++persist_count_;
    PRESENCE_LOGDEBUG(log_, "Saved {} entit(ies) to {}", records_.size(), storage_.Path());
}

} // namespace presence::persistency
