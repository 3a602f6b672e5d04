#include "policy/policy_loader.hpp"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace synx::policy {

using core::errors::ErrorKind;
using core::errors::get_error;
using core::errors::get_value;
using core::errors::is_error;
using core::errors::make_error;
using nlohmann::json;

const ExecutionPolicy& PolicySet::for_language(const std::string& language) const {
    const auto it = language_policies.find(language);
    if (it == language_policies.end()) {
        return default_policy;
    }
    return it->second;
}

core::errors::Result<PolicySet> PolicyLoader::load(
    const std::filesystem::path& path) const {
    std::ifstream in(path);
    if (!in.is_open()) {
        return make_error(ErrorKind::InvalidPolicy,
                          "Unable to open policy file: " + path.string());
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return make_error(ErrorKind::InvalidPolicy,
                          "I/O error while reading policy file: " + path.string());
    }
    return parse(buffer.str());
}

core::errors::Result<PolicySet> PolicyLoader::parse(const std::string& text) const {
    PolicySet policies;
    try {
        const json document = json::parse(text);
        if (!document.is_object()) {
            return make_error(ErrorKind::InvalidPolicy,
                              "Policy document must be a JSON object.");
        }

        ExecutionPolicy base;
        if (document.contains("default")) {
            from_json(document.at("default"), base);
        }
        auto validated = validate_policy(base);
        if (is_error(validated)) {
            return get_error(validated);
        }
        policies.default_policy = get_value(validated);

        if (document.contains("languages")) {
            const json& languages = document.at("languages");
            if (!languages.is_object()) {
                return make_error(ErrorKind::InvalidPolicy,
                                  "\"languages\" must map language names to policies.");
            }
            for (const auto& item : languages.items()) {
                const std::string language = item.key();
                // Overrides replace only the keys they name.
                ExecutionPolicy merged = base;
                from_json(item.value(), merged);
                auto checked = validate_policy(merged);
                if (is_error(checked)) {
                    auto error = get_error(checked);
                    error.message = "Language '" + language + "': " + error.message;
                    return error;
                }
                policies.language_policies.emplace(language, get_value(checked));
            }
        }
    } catch (const json::exception& e) {
        return make_error(ErrorKind::InvalidPolicy,
                          std::string("Malformed policy document: ") + e.what());
    }
    return policies;
}

}  // namespace synx::policy
