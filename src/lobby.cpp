#include "lobby.hpp"

#include "crypto/Crypto.h"
#include "errors.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>

namespace meshlobby {
namespace {

// Decodes UTF-8 into code points; false on malformed input.
bool decode_utf8(const std::string& s, std::vector<uint32_t>& out) {
    out.clear();
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        uint32_t cp = 0;
        size_t extra = 0;
        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            extra = 2;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07;
            extra = 3;
        } else {
            return false;
        }
        if (i + extra >= s.size()) return false;
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        out.push_back(cp);
        i += extra + 1;
    }
    return true;
}

bool is_cjk(uint32_t cp) {
    return (cp >= 0x4E00 && cp <= 0x9FFF) ||   // unified ideographs
           (cp >= 0x3400 && cp <= 0x4DBF) ||   // extension A
           (cp >= 0x20000 && cp <= 0x2A6DF) || // extension B
           (cp >= 0xF900 && cp <= 0xFAFF) ||   // compatibility ideographs
           (cp >= 0x3040 && cp <= 0x30FF) ||   // kana
           (cp >= 0xAC00 && cp <= 0xD7AF);     // hangul syllables
}

bool is_letter(uint32_t cp) {
    if (cp < 0x80) return std::isalpha(static_cast<int>(cp)) != 0;
    // Latin-1 and Latin Extended letters, minus the two operators.
    if (cp >= 0xC0 && cp <= 0x24F) return cp != 0xD7 && cp != 0xF7;
    return is_cjk(cp);
}

bool is_digit(uint32_t cp) {
    return cp >= '0' && cp <= '9';
}

bool is_space(uint32_t cp) {
    return cp == ' ' || cp == '\t' || cp == 0x3000;
}

} // namespace

nlohmann::json Session::to_json() const {
    return {
        {"id", id},
        {"name", name},
        {"createdAt", format_utc(created_at)},
        {"virtualIp", virtual_ip},
        {"creatorVirtualIp", creator_virtual_ip},
    };
}

nlohmann::json Member::to_json() const {
    return {
        {"id", id},
        {"name", name},
        {"micEnabled", mic_enabled},
        {"isMuted", is_muted},
        {"joinedAt", format_utc(joined_at)},
    };
}

LobbyManager::LobbyManager(TunnelSupervisor& tunnel, PeerDiscovery& discovery,
                           const Config& cfg, Logger& logger)
    : tunnel_(tunnel), discovery_(discovery), cfg_(cfg), logger_(logger) {}

void LobbyManager::validate_input(const std::string& input, const std::string& field) {
    if (trim(input).empty()) {
        throw Error(ErrorKind::Validation, field + " must not be empty or whitespace only");
    }
}

void LobbyManager::validate_lobby_name(const std::string& name) {
    std::vector<uint32_t> cps;
    if (!decode_utf8(trim(name), cps)) {
        throw Error(ErrorKind::Validation, "lobby name is not valid UTF-8");
    }
    if (cps.size() < 4) throw Error(ErrorKind::Validation, "lobby name needs at least 4 characters");
    if (cps.size() > 32) throw Error(ErrorKind::Validation, "lobby name allows at most 32 characters");

    bool has_alnum = std::any_of(cps.begin(), cps.end(),
                                 [](uint32_t cp) { return is_letter(cp) || is_digit(cp); });
    if (!has_alnum) {
        throw Error(ErrorKind::Validation, "lobby name must contain at least one letter or digit");
    }
    bool allowed = std::all_of(cps.begin(), cps.end(), [](uint32_t cp) {
        return is_letter(cp) || is_digit(cp) || is_space(cp) || cp == '_' || cp == '-';
    });
    if (!allowed) {
        throw Error(ErrorKind::Validation,
                    "lobby name may only contain letters, digits, CJK, spaces, '_' and '-'");
    }
}

void LobbyManager::validate_password(const std::string& password) {
    const std::string p = trim(password);
    if (p.size() < 8) throw Error(ErrorKind::Validation, "password needs at least 8 characters");
    if (p.size() > 32) throw Error(ErrorKind::Validation, "password allows at most 32 characters");

    std::vector<uint32_t> cps;
    if (!decode_utf8(p, cps)) throw Error(ErrorKind::Validation, "password is not valid UTF-8");
    if (std::none_of(cps.begin(), cps.end(), is_letter)) {
        throw Error(ErrorKind::Validation, "password must contain at least one letter");
    }
    if (std::none_of(cps.begin(), cps.end(), is_digit)) {
        throw Error(ErrorKind::Validation, "password must contain at least one digit");
    }
}

void LobbyManager::validate(const std::string& name, const std::string& password,
                            const std::string& player_name, const std::string& rendezvous) {
    validate_lobby_name(name);
    validate_password(password);
    validate_input(player_name, "player name");
    validate_input(rendezvous, "rendezvous peer");
}

void LobbyManager::set_event_sink(EventSink sink) {
    std::lock_guard<std::mutex> lk(sink_mu_);
    sink_ = std::move(sink);
}

void LobbyManager::emit(const Event& ev) {
    EventSink sink;
    {
        std::lock_guard<std::mutex> lk(sink_mu_);
        sink = sink_;
    }
    if (sink) sink(ev);
}

Event LobbyManager::lobby_update() const {
    auto s = current_session();
    if (!s) return Event{events::kLobbyUpdate, {{"inLobby", false}}};

    nlohmann::json members = nlohmann::json::array();
    for (const auto& m : this->members()) members.push_back(m.to_json());
    return Event{events::kLobbyUpdate,
                 {{"inLobby", true}, {"lobby", s->to_json()}, {"members", members}}};
}

Session LobbyManager::create(const std::string& name, const std::string& password,
                             const std::string& player_name, const std::string& rendezvous) {
    return bring_up(name, password, player_name, rendezvous, cfg_.discovery_on_create, "create");
}

Session LobbyManager::join(const std::string& name, const std::string& password,
                           const std::string& player_name, const std::string& rendezvous) {
    return bring_up(name, password, player_name, rendezvous, true, "join");
}

Session LobbyManager::bring_up(const std::string& name, const std::string& password,
                               const std::string& player_name, const std::string& rendezvous,
                               bool start_discovery, const char* verb) {
    {
        std::lock_guard<std::mutex> lk(session_mu_);
        if (session_ || busy_) throw Error(ErrorKind::AlreadyInLobby, session_ ? session_->name : name);
        validate(name, password, player_name, rendezvous);
        busy_ = true;
    }
    struct BusyReset {
        LobbyManager* self;
        ~BusyReset() {
            std::lock_guard<std::mutex> lk(self->session_mu_);
            self->busy_ = false;
        }
    } busy_reset{this};

    const std::string lobby_name = trim(name);
    const std::string network_name = cfg_.namespace_prefix + lobby_name;
    logger_.info(std::string(verb) + " lobby '" + lobby_name + "' network=" + network_name +
                 " secret#" + crypto::Sha256::Fingerprint(password));

    const std::string ip = tunnel_.start(network_name, password, trim(rendezvous));

    Member me;
    me.id = crypto::Random::Uuid();
    me.name = trim(player_name);
    me.joined_at = std::chrono::system_clock::now();

    if (start_discovery) {
        try {
            discovery_.start(me.id, me.name, ip);
        } catch (const Error& e) {
            logger_.error(std::string("discovery start failed, rolling back tunnel: ") + e.what());
            tunnel_.stop();
            throw Error(ErrorKind::Network, "discovery start failed: " + e.detail());
        }
    }

    Session s;
    s.id = crypto::Random::Uuid();
    s.name = lobby_name;
    s.created_at = std::chrono::system_clock::now();
    s.virtual_ip = ip;
    s.creator_virtual_ip = cfg_.signaling_address;

    {
        std::lock_guard<std::mutex> lk(roster_mu_);
        roster_.clear();
        roster_.emplace(me.id, me);
    }
    {
        std::lock_guard<std::mutex> lk(session_mu_);
        session_ = s;
        local_id_ = me.id;
    }
    logger_.info(std::string(verb) + " ok: lobby=" + s.name + " ip=" + ip + " signaling=" +
                 s.creator_virtual_ip + ":" + std::to_string(cfg_.signaling_port) + " member=" + me.id);
    emit(lobby_update());
    return s;
}

void LobbyManager::leave() {
    // A concurrent caller waits here and then finds no session.
    std::lock_guard<std::mutex> teardown(leave_mu_);
    std::string name;
    {
        std::lock_guard<std::mutex> lk(session_mu_);
        if (!session_) throw Error(ErrorKind::NotInLobby, "no active lobby");
        name = session_->name;
    }
    logger_.info("leaving lobby " + name);

    try {
        discovery_.stop();
    } catch (const std::exception& e) {
        logger_.warn(std::string("discovery stop failed: ") + e.what());
    }
    try {
        tunnel_.stop();
    } catch (const std::exception& e) {
        logger_.warn(std::string("tunnel stop failed: ") + e.what());
    }

    clear_members();
    {
        std::lock_guard<std::mutex> lk(session_mu_);
        session_.reset();
        local_id_.clear();
    }
    logger_.info("left lobby " + name);
    emit(lobby_update());
}

bool LobbyManager::add_member(const Member& m) {
    std::lock_guard<std::mutex> lk(roster_mu_);
    bool inserted = roster_.emplace(m.id, m).second;
    if (inserted) logger_.info("member added: " + m.name + " (" + m.id + ")");
    return inserted;
}

void LobbyManager::remove_member(const std::string& id) {
    std::lock_guard<std::mutex> lk(roster_mu_);
    if (roster_.erase(id) == 0) throw Error(ErrorKind::PlayerNotFound, id);
    logger_.info("member removed: " + id);
}

void LobbyManager::update_mic(const std::string& id, bool enabled) {
    std::lock_guard<std::mutex> lk(roster_mu_);
    auto it = roster_.find(id);
    if (it == roster_.end()) throw Error(ErrorKind::PlayerNotFound, id);
    it->second.mic_enabled = enabled;
}

void LobbyManager::update_muted(const std::string& id, bool muted) {
    std::lock_guard<std::mutex> lk(roster_mu_);
    auto it = roster_.find(id);
    if (it == roster_.end()) throw Error(ErrorKind::PlayerNotFound, id);
    it->second.is_muted = muted;
}

void LobbyManager::clear_members() {
    std::lock_guard<std::mutex> lk(roster_mu_);
    roster_.clear();
}

void LobbyManager::set_local_mic(bool enabled) {
    const std::string id = local_member_id();
    if (id.empty()) throw Error(ErrorKind::NotInLobby, "no active lobby");
    update_mic(id, enabled);
    if (discovery_.is_running()) {
        auto me = member(id);
        discovery_.broadcast_status(enabled, me ? std::optional<bool>(me->is_muted) : std::nullopt);
    }
}

std::vector<Member> LobbyManager::members() const {
    std::vector<Member> out;
    {
        std::lock_guard<std::mutex> lk(roster_mu_);
        out.reserve(roster_.size());
        for (const auto& kv : roster_) out.push_back(kv.second);
    }
    std::sort(out.begin(), out.end(), [](const Member& a, const Member& b) {
        if (a.joined_at != b.joined_at) return a.joined_at < b.joined_at;
        return a.id < b.id;
    });
    return out;
}

std::optional<Member> LobbyManager::member(const std::string& id) const {
    std::lock_guard<std::mutex> lk(roster_mu_);
    auto it = roster_.find(id);
    if (it == roster_.end()) return std::nullopt;
    return it->second;
}

size_t LobbyManager::member_count() const {
    std::lock_guard<std::mutex> lk(roster_mu_);
    return roster_.size();
}

std::string LobbyManager::local_member_id() const {
    std::lock_guard<std::mutex> lk(session_mu_);
    return local_id_;
}

std::optional<Session> LobbyManager::current_session() const {
    std::lock_guard<std::mutex> lk(session_mu_);
    return session_;
}

bool LobbyManager::in_lobby() const {
    std::lock_guard<std::mutex> lk(session_mu_);
    return session_.has_value();
}

void LobbyManager::on_discovery_event(const Event& ev) {
    if (in_lobby()) {
        const auto& p = ev.payload;
        const std::string id = p.value("playerId", std::string());
        if (ev.name == events::kPlayerJoined && !id.empty()) {
            Member m;
            m.id = id;
            m.name = p.value("playerName", std::string());
            m.joined_at = std::chrono::system_clock::now();
            add_member(m);
        } else if (ev.name == events::kPlayerLeft && !id.empty()) {
            std::lock_guard<std::mutex> lk(roster_mu_);
            if (roster_.erase(id) > 0) logger_.info("member left: " + id);
        } else if (ev.name == events::kStatusUpdate && !id.empty()) {
            std::lock_guard<std::mutex> lk(roster_mu_);
            auto it = roster_.find(id);
            if (it != roster_.end()) {
                it->second.mic_enabled = p.value("micEnabled", it->second.mic_enabled);
                if (p.contains("isMuted") && p["isMuted"].is_boolean()) {
                    it->second.is_muted = p["isMuted"].get<bool>();
                }
            }
        }
    }
    emit(ev);
}

} // namespace meshlobby
