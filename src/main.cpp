#include "config.hpp"
#include "data_source.hpp"
#include "errors.hpp"
#include "image_sink.hpp"
#include "tensor_io.hpp"
#include "wct2.hpp"

#include <torch/torch.h>

#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace {

struct CommandLine {
    std::string command;
    std::map<std::string, std::string> options;   // command-specific --name=value
    std::vector<std::string> config_args;         // forwarded to parse_config
};

std::set<std::string> const kCommandOptions = {
    "data", "validation", "epochs", "content", "style", "output", "alpha"};

CommandLine split_command_line(int argc, char** argv) {
    CommandLine cl;
    if (argc > 1) {
        cl.command = argv[1];
    }
    for (int i = 2; i < argc; ++i) {
        std::string const arg = argv[i];
        auto const eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            auto const name = arg.substr(2, eq - 2);
            if (kCommandOptions.count(name) != 0) {
                cl.options[name] = arg.substr(eq + 1);
                continue;
            }
        }
        cl.config_args.push_back(arg);
    }
    return cl;
}

std::string require_option(CommandLine const& cl, std::string const& name) {
    auto const it = cl.options.find(name);
    if (it == cl.options.end()) {
        throw std::invalid_argument("Missing --" + name + "=<value>");
    }
    return it->second;
}

/// Unit-range RGB as [N, 3, H, W] (a single [3, H, W] image gains a batch dim).
torch::Tensor load_images(std::string const& path) {
    auto images = load_tensor_file(path).to(torch::kFloat32);
    if (images.dim() == 3) {
        images = images.unsqueeze(0);
    }
    return images;
}

torch::Tensor resize_to(torch::Tensor const& images, int64_t resolution) {
    if (images.size(2) == resolution && images.size(3) == resolution) {
        return images;
    }
    namespace F = torch::nn::functional;
    return F::interpolate(images, F::InterpolateFuncOptions()
                                      .size(std::vector<int64_t>{resolution, resolution})
                                      .mode(torch::kBilinear)
                                      .align_corners(false));
}

void print_usage() {
    std::cout
        << "Usage:\n"
        << "  wct2 train --data=<images.pt> --epochs=<n> [--validation=<images.pt>] [options]\n"
        << "  wct2 transfer --content=<image.pt> --style=<image.pt> --output=<out.pt>"
           " [--alpha=<0..1>] [options]\n"
        << "  wct2 version\n"
        << "Options: --base_dir --weights_file --backbone_weights --resolution --learning_rate\n"
        << "         --show_interval --gram_loss_weight --wct_epsilon --batch_size --wavelet\n"
        << "         --odd_size_policy --seed\n"
        << "Image files hold unit-range RGB tensors shaped [N, 3, H, W] or [3, H, W].\n"
        << "transfer also writes content, style and result side by side to"
           " <base_dir>/transfer_0.pt."
        << std::endl;
}

int run_train(CommandLine const& cl) {
    auto const config = parse_config(cl.config_args);
    int const epochs = std::stoi(require_option(cl, "epochs"));
    auto images = normalize(resize_to(load_images(require_option(cl, "data")), config.resolution));

    std::optional<TensorBatchSource> validation;
    auto const val_it = cl.options.find("validation");
    if (val_it != cl.options.end()) {
        validation.emplace(normalize(resize_to(load_images(val_it->second), config.resolution)),
                           config.batch_size, /*shuffle=*/false);
    }

    Wct2 wct2(config);
    auto const loaded = wct2.load_weights();
    if (!loaded.ok()) {
        std::cout << "Training from the backbone initialization" << std::endl;
    }
    TensorBatchSource source(images, config.batch_size);
    auto const history = wct2.train(source, epochs, validation ? &*validation : nullptr);
    auto const saved = wct2.save_weights();
    if (!saved.ok()) {
        std::cerr << "Trained weights were not saved" << std::endl;
    }

    if (!history.loss.empty()) {
        std::cout << "Final loss: " << history.loss.back() << std::endl;
    }
    return 0;
}

int run_transfer(CommandLine const& cl) {
    auto const config = parse_config(cl.config_args);
    double alpha = 1.0;
    auto const alpha_it = cl.options.find("alpha");
    if (alpha_it != cl.options.end()) {
        alpha = std::stod(alpha_it->second);
    }
    auto content = normalize(load_images(require_option(cl, "content")));
    auto style = normalize(load_images(require_option(cl, "style")));
    auto const output_path = require_option(cl, "output");

    Wct2 wct2(config);
    auto const loaded = wct2.load_weights();
    if (!loaded.ok()) {
        std::cerr << "Transferring with an untrained decoder" << std::endl;
    }
    TensorFileSink panel_sink(config.base_dir, "transfer");
    auto stylized = wct2.show_sample(content, style, alpha, &panel_sink);
    save_tensor_file(deprocess(denormalize(stylized)), output_path);
    std::cout << "Wrote " << output_path << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    auto const cl = split_command_line(argc, argv);
    try {
        if (cl.command == "train") {
            return run_train(cl);
        }
        if (cl.command == "transfer") {
            return run_transfer(cl);
        }
        if (cl.command == "version") {
            std::cout << "LibTorch version: " << TORCH_VERSION << std::endl;
            std::cout << "CUDA available:   " << (torch::cuda::is_available() ? "yes" : "no") << std::endl;
            return 0;
        }
        print_usage();
        return cl.command.empty() || cl.command == "help" ? 0 : 1;
    } catch (ShapeError const& e) {
        std::cerr << "Shape error: " << e.what() << std::endl;
    } catch (NumericalError const& e) {
        std::cerr << "Numerical error: " << e.what() << std::endl;
    } catch (PersistenceError const& e) {
        std::cerr << "I/O error: " << e.what() << std::endl;
    } catch (std::exception const& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }
    return 1;
}
