#include "core/environment.hpp"

#include <cstdlib>
#include <regex>

Environment::Environment()
    : lookup_([](const std::string& name) -> std::optional<std::string> {
          const char* value = std::getenv(name.c_str());
          if (!value) return std::nullopt;
          return std::string(value);
      }) {}

Environment::Environment(Lookup lookup) : lookup_(std::move(lookup)) {}

Environment Environment::from_map(std::map<std::string, std::string> vars) {
    return Environment([vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    });
}

std::optional<std::string> Environment::get(const std::string& name) const {
    if (!lookup_) return std::nullopt;
    return lookup_(name);
}

std::string Environment::expand(const std::string& input) const {
    static const std::regex var_re(R"(\$\{([A-Z0-9_]+)\})");

    std::string out;
    out.reserve(input.size());

    auto begin = std::sregex_iterator(input.begin(), input.end(), var_re);
    auto end = std::sregex_iterator();
    std::size_t last = 0;
    for (auto it = begin; it != end; ++it) {
        const auto& m = *it;
        out.append(input, last, m.position(0) - last);

        std::string key = m[1].str();
        if (key == "APP_BIN") {
            auto bin = get(APP_BIN_OVERRIDE);
            out += bin ? *bin : APP_BIN_DEFAULT;
        } else {
            out += get(key).value_or("");
        }
        last = m.position(0) + m.length(0);
    }
    out.append(input, last, std::string::npos);
    return out;
}
