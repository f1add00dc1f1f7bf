/**
 * @file secrets_json.hpp
 * @brief JSON text secrets backend (ArduinoJson)
 *
 * @details
 * Persists a SecretStore as a JSON array of `[type, base64(key), base64(value)]`
 * triples, for example:
 * @code
 * [[1,"AQIDBAUGAA==","q83v"],[2,"AAAAAAAAAA==","/w=="]]
 * @endcode
 * Writes go to `<path>.tmp` and are renamed over @p path.
 */

#ifndef BLEHID_SECRETS_JSON_HPP_
#define BLEHID_SECRETS_JSON_HPP_

#include <string>

#include "secrets.hpp"

namespace blehid {

class JsonFileSecretBackend : public SecretBackend {
public:
    explicit JsonFileSecretBackend(std::string path) : path_(std::move(path)) {}

    [[nodiscard]] bool load(SecretStore& store) override;
    [[nodiscard]] bool save(const SecretStore& store) override;
    [[nodiscard]] const char* name() const override { return path_.c_str(); }

    /// Render the store as a JSON document (text triples)
    [[nodiscard]] static std::string toJson(const SecretStore& store);

    /// Replace the store from a JSON document; unchanged on parse or format errors
    [[nodiscard]] static bool fromJson(const std::string& json, SecretStore& store);

private:
    std::string path_;
};

} // namespace blehid

#endif // BLEHID_SECRETS_JSON_HPP_
