#pragma once

#include <initializer_list>
#include <set>
#include <stdexcept>
#include <string>
#include <boost/property_tree/ptree.hpp>

namespace PaperPerp::Strategy {
    // Typed read of one option; a value that does not parse is reported by key
    template <typename T>
    T read_option(const boost::property_tree::ptree& options, const std::string& key, const T& fallback) {
        try {
            return options.get<T>(key, fallback);
        }
        catch (const boost::property_tree::ptree_bad_data&) {
            throw std::invalid_argument("option '" + key + "' has an invalid value '"
                + options.get<std::string>(key, "") + "'");
        }
    }

    // Keys every strategy accepts besides its own
    inline const std::set<std::string>& common_option_keys() {
        static const std::set<std::string> keys = { "cooldown_seconds", "evaluate_timeout_ms", "name" };
        return keys;
    }

    inline void reject_unknown_options(const boost::property_tree::ptree& options,
        std::initializer_list<const char*> known, const std::string& strategy)
    {
        std::set<std::string> allowed(known.begin(), known.end());
        for (const auto& [key, value] : options) {
            if (!allowed.count(key) && !common_option_keys().count(key)) {
                throw std::invalid_argument("unknown option '" + key + "' for strategy " + strategy);
            }
        }
    }

    inline void require(bool condition, const std::string& field, const std::string& rule) {
        if (!condition) {
            throw std::invalid_argument(field + " " + rule);
        }
    }
}
