#include "config.hpp"

#include <stdexcept>

static int64_t parse_int(std::string const& name, std::string const& value) {
    size_t consumed = 0;
    int64_t result = 0;
    try {
        result = std::stoll(value, &consumed);
    } catch (std::exception const&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != value.size()) {
        throw std::invalid_argument("Option " + name + " expects an integer, got '" + value + "'");
    }
    return result;
}

static double parse_double(std::string const& name, std::string const& value) {
    size_t consumed = 0;
    double result = 0.0;
    try {
        result = std::stod(value, &consumed);
    } catch (std::exception const&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != value.size()) {
        throw std::invalid_argument("Option " + name + " expects a number, got '" + value + "'");
    }
    return result;
}

static int64_t parse_positive(std::string const& name, std::string const& value) {
    int64_t const result = parse_int(name, value);
    if (result < 1) {
        throw std::invalid_argument("Option " + name + " must be >= 1, got " + value);
    }
    return result;
}

void apply_config_option(Wct2Config& config, std::string const& name, std::string const& value) {
    if (name == "base_dir") {
        config.base_dir = value;
    } else if (name == "weights_file") {
        config.weights_file = value;
    } else if (name == "backbone_weights") {
        config.backbone_weights = value;
    } else if (name == "resolution") {
        config.resolution = parse_positive(name, value);
    } else if (name == "learning_rate") {
        config.learning_rate = parse_double(name, value);
    } else if (name == "show_interval") {
        config.show_interval = static_cast<int>(parse_positive(name, value));
    } else if (name == "gram_loss_weight") {
        config.gram_loss_weight = parse_double(name, value);
    } else if (name == "wct_epsilon") {
        config.wct_epsilon = parse_double(name, value);
    } else if (name == "batch_size") {
        config.batch_size = parse_positive(name, value);
    } else if (name == "wavelet") {
        config.wavelet = value;
    } else if (name == "odd_size_policy") {
        config.odd_size_policy = parse_odd_size_policy(value);
    } else if (name == "seed") {
        int64_t const seed = parse_int(name, value);
        if (seed < 0) {
            throw std::invalid_argument("Option seed must be >= 0, got " + value);
        }
        config.seed = static_cast<unsigned long long>(seed);
    } else {
        throw std::invalid_argument("Unknown option: " + name);
    }
}

Wct2Config parse_config(
    std::vector<std::string> const& args,
    std::vector<std::string>* positional) {

    Wct2Config config;
    for (auto const& arg : args) {
        if (arg.rfind("--", 0) != 0) {
            if (positional == nullptr) {
                throw std::invalid_argument("Unexpected argument: " + arg);
            }
            positional->push_back(arg);
            continue;
        }
        auto const eq = arg.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument("Option " + arg + " needs a value (--name=value)");
        }
        apply_config_option(config, arg.substr(2, eq - 2), arg.substr(eq + 1));
    }
    return config;
}
