#include "etcalc/JsonUtils.hpp"
#include "etcalc/Errors.hpp"

#include <cstdlib>
#include <fstream>
#include <regex>

namespace etcalc {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw ConfigurationError("Cannot open '" + path + "'");
    try {
        return nlohmann::json::parse(in, nullptr, true, /*ignore_comments=*/true);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("Malformed JSON in '" + path + "': " + e.what());
    }
}

// Single left to right pass, substituted text is not scanned again
static std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([A-Za-z_][A-Za-z0-9_]*)\})");
    std::string out;
    auto last = input.cbegin();
    for (std::sregex_iterator it(input.begin(), input.end(), re), end; it != end; ++it) {
        const std::smatch& m = *it;
        const std::string var = m[1];
        const char* env = std::getenv(var.c_str());
        if (!env)
            throw ConfigurationError("Environment variable '" + var + "' is not set");
        out.append(last, m[0].first);
        out += env;
        last = m[0].second;
    }
    out.append(last, input.cend());
    return out;
}

void expand_env(nlohmann::json& j)
{
    if (j.is_string()) {
        const std::string& s = j.get_ref<const std::string&>();
        if (s.find("${") != std::string::npos) j = expand(s);
    } else if (j.is_structured()) {
        for (auto& el : j) expand_env(el);
    }
}

} // namespace etcalc
