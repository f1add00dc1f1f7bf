/**
 * @file secrets_json.cpp
 * @brief ArduinoJson rendering of the secrets text triples
 */

#include "blehid/secrets_json.hpp"

#include <ArduinoJson.h>

#include <cstdio>
#include <fstream>
#include <iterator>

#include "blehid/log.h"

namespace blehid {

namespace {
    // Bond tables are small: a few entries per bonded central
    constexpr size_t MAX_JSON_NESTING_DEPTH = 4;
}

std::string JsonFileSecretBackend::toJson(const SecretStore& store) {
    JsonDocument doc;
    JsonArray root = doc.to<JsonArray>();
    for (const auto& entry : store.exportEntries()) {
        JsonArray triple = root.add<JsonArray>();
        triple.add(entry.type);
        triple.add(entry.key);
        triple.add(entry.value);
    }

    std::string out;
    serializeJson(doc, out);
    return out;
}

bool JsonFileSecretBackend::fromJson(const std::string& json, SecretStore& store) {
    JsonDocument doc;
    DeserializationError error = deserializeJson(
        doc, json,
        DeserializationOption::NestingLimit(MAX_JSON_NESTING_DEPTH)
    );
    if (error) {
        BLEHID_LOG_ERROR("Secrets JSON parse error: %s\n", error.c_str());
        return false;
    }
    if (!doc.is<JsonArray>()) {
        BLEHID_LOG_ERROR("Secrets JSON: expected an array of triples\n");
        return false;
    }

    std::vector<SecretTextEntry> entries;
    for (JsonVariant item : doc.as<JsonArray>()) {
        JsonArray triple = item.as<JsonArray>();
        if (triple.isNull() || triple.size() != 3 ||
            !triple[0].is<uint8_t>() || !triple[1].is<const char*>() || !triple[2].is<const char*>()) {
            BLEHID_LOG_ERROR("Secrets JSON: malformed entry %u\n", static_cast<unsigned>(entries.size()));
            return false;
        }
        entries.push_back(SecretTextEntry{
            triple[0].as<uint8_t>(),
            triple[1].as<const char*>(),
            triple[2].as<const char*>(),
        });
    }
    return store.importEntries(entries);
}

bool JsonFileSecretBackend::load(SecretStore& store) {
    std::ifstream in(path_);
    if (!in) {
        BLEHID_LOG_INFO("No secrets file at %s\n", path_.c_str());
        return false;
    }
    const std::string json((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return fromJson(json, store);
}

bool JsonFileSecretBackend::save(const SecretStore& store) {
    const std::string json = toJson(store);
    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            BLEHID_LOG_ERROR("Cannot open %s for writing\n", tmp_path.c_str());
            return false;
        }
        out << json;
        out.flush();
        if (!out) {
            BLEHID_LOG_ERROR("Write error on %s\n", tmp_path.c_str());
            return false;
        }
    }
    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        BLEHID_LOG_ERROR("Cannot replace %s\n", path_.c_str());
        std::remove(tmp_path.c_str());
        return false;
    }
    return true;
}

} // namespace blehid
