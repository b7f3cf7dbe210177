#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "wavelet_pool.hpp"

/// Settings shared by training and transfer. Every field can be set from the
/// command line as --<name>=<value>, with the name spelled as below.
struct Wct2Config {
    std::string base_dir = ".";              // base_dir: weights and samples live here
    std::string weights_file = "wct2.pt";    // weights_file
    std::string backbone_weights;            // backbone_weights: VGG19 archive, optional
    int64_t resolution = 256;                // resolution: training image side length
    double learning_rate = 1e-4;             // learning_rate
    int show_interval = 25;                  // show_interval: epochs between samples
    double gram_loss_weight = 1.0;           // gram_loss_weight
    double wct_epsilon = 1e-5;               // wct_epsilon
    int64_t batch_size = 8;                  // batch_size
    std::string wavelet = "haar";            // wavelet
    OddSizePolicy odd_size_policy = OddSizePolicy::replicate_pad;   // odd_size_policy
    unsigned long long seed = 0;             // seed: 0 keeps LibTorch's default

    std::string weights_path() const { return base_dir + "/" + weights_file; }
};

/// Apply one "name=value" assignment. Throws std::invalid_argument for an
/// unknown name or a value that does not parse.
void apply_config_option(Wct2Config& config, std::string const& name, std::string const& value);

/// Build a config from "--name=value" arguments. Arguments that do not start
/// with "--" are returned in positional, in order.
Wct2Config parse_config(
    std::vector<std::string> const& args,
    std::vector<std::string>* positional = nullptr);
