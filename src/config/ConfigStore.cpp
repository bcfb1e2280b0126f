/**
 * ConfigStore.cpp - JSON configuration with dotted key paths
 */

#include "xvc/config/ConfigStore.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

using json = nlohmann::json;

namespace xvc::config {

namespace {

constexpr const char* kClientIdKey = "SYSTEM_OPTIONS.CLIENT_ID";
constexpr const char* kDeviceIdKey = "SYSTEM_OPTIONS.DEVICE_ID";

// First non-loopback, non-zero hardware address under /sys/class/net
std::string interfaceMac() {
    namespace fs = std::filesystem;
    std::error_code ec;
    std::vector<fs::path> interfaces;
    for (const auto& entry : fs::directory_iterator("/sys/class/net", ec)) {
        interfaces.push_back(entry.path());
    }
    std::sort(interfaces.begin(), interfaces.end());

    for (const auto& dir : interfaces) {
        if (dir.filename() == "lo") continue;
        std::ifstream file(dir / "address");
        std::string mac;
        if (!(file >> mac)) continue;
        if (mac.size() == 17 && mac != "00:00:00:00:00:00") {
            return mac;
        }
    }
    return "";
}

// Locally administered unicast address built from random bytes
std::string generatedMac(const boost::uuids::uuid& seed) {
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                  (seed.data[0] | 0x02) & 0xFE, seed.data[1], seed.data[2],
                  seed.data[3], seed.data[4], seed.data[5]);
    return buf;
}

bool unset(const json* node) {
    return !node || node->is_null() || (node->is_string() && node->get_ref<const std::string&>().empty());
}

} // namespace

ConfigStore::ConfigStore() : root_(defaults()) {}

json ConfigStore::defaults() {
    return {
        {"SYSTEM_OPTIONS", {
            {"CLIENT_ID", nullptr},
            {"DEVICE_ID", nullptr},
            {"LISTEN_MODE", "auto"},
            {"NETWORK", {
                {"TRANSPORT", "websocket"},
                {"OTA_VERSION_URL", "https://api.tenclass.net/xiaozhi/ota/"},
                {"WEBSOCKET_URL", "wss://api.tenclass.net/xiaozhi/v1/"},
                {"WEBSOCKET_ACCESS_TOKEN", "test-token"},
                {"MQTT_INFO", nullptr},
            }},
        }},
        {"WAKE_WORD_OPTIONS", {
            {"USE_WAKE_WORD", false},
            {"MODEL_PATH", "models/whisper/ggml-base-q5_1.bin"},
            {"WAKE_WORDS", json::array({"小智", "小美"})},
            {"THRESHOLD", 0.85},
            {"CACHE_CAPACITY", 1024},
            {"COOLDOWN_MS", 2000},
            {"INITIALS_FLOOR", 0.5},
            {"PINYIN_LEXICON", ""},
        }},
        {"VAD_OPTIONS", {
            {"MODE", 3},
            {"FRAME_MS", 20},
            {"ENERGY_THRESHOLD", 300},
            {"START_FRAMES", 3},
            {"END_FRAMES", 25},
            {"WINDOW_FRAMES", 10},
            {"INTERRUPT_ENERGY_THRESHOLD", 600},
            {"INTERRUPT_FRAMES", 5},
        }},
        {"SESSION_OPTIONS", {
            {"OPEN_TIMEOUT_MS", 10000},
            {"SILENCE_TIMEOUT_MS", 8000},
            {"ACTIVATION_MAX_RETRIES", 60},
            {"ACTIVATION_RETRY_INTERVAL_MS", 5000},
            {"BARGE_IN_CONFIDENCE", 0.5},
            {"PLAYBACK_DRAIN_CHECKS", 30},
        }},
        {"AUDIO_OPTIONS", {
            {"INPUT_SAMPLE_RATE", 16000},
            {"OUTPUT_SAMPLE_RATE", 24000},
            {"FRAME_DURATION_MS", 60},
        }},
    };
}

bool ConfigStore::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.good()) {
        std::cerr << "[Config] " << path << " not found, using defaults" << std::endl;
        return false;
    }

    std::stringstream contents;
    contents << file.rdbuf();
    if (!loadFromString(contents.str())) {
        std::cerr << "[Config] " << path << " is malformed, using defaults" << std::endl;
        return false;
    }

    std::cout << "[Config] Loaded " << path << std::endl;
    return true;
}

bool ConfigStore::loadFromString(const std::string& text) {
    try {
        json overlay = json::parse(text);
        if (!overlay.is_object()) {
            std::cerr << "[Config] Top-level value must be an object" << std::endl;
            return false;
        }
        merge(root_, overlay);
        return true;
    } catch (const json::parse_error& e) {
        std::cerr << "[Config] Parse error: " << e.what() << std::endl;
        return false;
    }
}

bool ConfigStore::ensureIdentity(const std::string& persist_path) {
    bool generated = false;
    boost::uuids::random_generator generator;

    if (unset(find(kClientIdKey))) {
        std::string clientId = boost::uuids::to_string(generator());
        set(kClientIdKey, clientId);
        std::cout << "[Config] Generated client id " << clientId << std::endl;
        generated = true;
    }

    if (unset(find(kDeviceIdKey))) {
        std::string deviceId = interfaceMac();
        if (deviceId.empty()) {
            deviceId = generatedMac(generator());
            std::cerr << "[Config] No network interface address, using generated device id" << std::endl;
        }
        set(kDeviceIdKey, deviceId);
        std::cout << "[Config] Device id " << deviceId << std::endl;
        generated = true;
    }

    if (!generated || persist_path.empty()) {
        return true;
    }
    return save(persist_path);
}

bool ConfigStore::save(const std::string& path) const {
    std::error_code ec;
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.good()) {
        std::cerr << "[Config] Cannot write " << path << std::endl;
        return false;
    }
    file << root_.dump(2) << std::endl;
    if (!file.good()) {
        std::cerr << "[Config] Write to " << path << " failed" << std::endl;
        return false;
    }
    std::cout << "[Config] Saved " << path << std::endl;
    return true;
}

void ConfigStore::set(const std::string& key_path, json value) {
    json* node = &root_;
    std::stringstream segments(key_path);
    std::string segment;

    while (std::getline(segments, segment, '.')) {
        if (!node->is_object()) *node = json::object();
        node = &(*node)[segment];
    }
    *node = std::move(value);
}

const json* ConfigStore::find(const std::string& key_path) const {
    const json* node = &root_;
    std::stringstream segments(key_path);
    std::string segment;

    while (std::getline(segments, segment, '.')) {
        if (!node->is_object()) return nullptr;
        auto it = node->find(segment);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

void ConfigStore::merge(json& base, const json& overlay) {
    for (auto& [key, value] : overlay.items()) {
        if (value.is_object() && base.contains(key) && base[key].is_object()) {
            merge(base[key], value);
        } else {
            base[key] = value;
        }
    }
}

} // namespace xvc::config
