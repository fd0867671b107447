#include "holofit/ModelDescription.hpp"
#include "holofit/ThreadPool.hpp"
#include <cxxopts.hpp>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

using namespace holofit;

namespace {

std::vector<std::string> split_names(const std::string& csv)
{
    std::vector<std::string> out;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ','))
        if (!item.empty()) out.push_back(item);
    return out;
}

void print_parameter_table(const Model& model)
{
    const auto pars  = model.parameters();
    const auto guess = model.initial_guess();

    std::cout << "\n=== Free parameters (" << pars.size() << ") ===\n";
    for (std::size_t i = 0; i < pars.size(); ++i) {
        std::cout << std::setw(4) << i << "  "
                  << std::left << std::setw(28) << pars[i].first << std::right
                  << std::setw(14) << guess[static_cast<Eigen::Index>(i)] << "  "
                  << pars[i].second->describe() << '\n';
    }
}

void print_reconstruction(const Model& model)
{
    const Vector guess = model.initial_guess();
    std::cout << "\n=== Configuration at initial guess ===\n";
    for (const auto& group : model.groups())
        std::cout << std::left << std::setw(10) << group << std::right << ' '
                  << model.read_group(group, guess) << '\n';
}

} // namespace

int main(int argc, char** argv)
{
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("holofit", "Inspect, tie and serialise hologram inference models");
        opts.add_options()
            ("model", "Model description JSON", cxxopts::value<std::string>())
            ("load", "Serialised model written earlier with --out", cxxopts::value<std::string>())
            ("tie", "Comma separated parameter names to tie", cxxopts::value<std::string>())
            ("tie-name", "Name of the tied parameter", cxxopts::value<std::string>())
            ("out", "Write the serialised model to this file", cxxopts::value<std::string>())
            ("guesses", "Evaluate the prior at N random starting points",
                cxxopts::value<int>()->default_value("0"))
            ("seed", "Random seed for --guesses", cxxopts::value<unsigned>())
            ("threads", "Number of threads", cxxopts::value<int>()->default_value("0"))
            ("show", "Print the configuration reconstructed at the initial guess")
            ("v,verbose", "Report model construction and ties")
            ("h,help", "Show help");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help") || cli.count("model") + cli.count("load") != 1) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        Model::Options options;
        options.verbose = cli.count("verbose") > 0;

        Model model = [&] {
            if (cli.count("load")) return load_model(cli["load"].as<std::string>(), options);
            return build_model(load_model_description(cli["model"].as<std::string>()), options);
        }();
        if (cli.count("tie")) {
            std::optional<std::string> name;
            if (cli.count("tie-name")) name = cli["tie-name"].as<std::string>();
            model.add_tie(split_names(cli["tie"].as<std::string>()), name);
        }

        print_parameter_table(model);

        if (cli.count("show")) print_reconstruction(model);

        const int n_guess = cli["guesses"].as<int>();
        if (n_guess > 0) {
            int nthreads = cli["threads"].as<int>();
            if (nthreads <= 0) nthreads = static_cast<int>(std::thread::hardware_concurrency());

            std::optional<unsigned> seed;
            if (cli.count("seed")) seed = cli["seed"].as<unsigned>();

            ThreadPool pool(static_cast<unsigned>(nthreads));
            const Matrix guesses = model.generate_guess(n_guess, 1.0, seed);
            const Vector lnp     = model.lnprior_batch(guesses, pool);

            std::cout << "\n=== ln prior at " << n_guess << " starting points ("
                      << pool.size() << " threads) ===\n";
            for (Eigen::Index r = 0; r < guesses.rows(); ++r)
                std::cout << std::setw(4) << r << "  " << lnp[r] << '\n';
        }

        if (cli.count("out")) {
            save_model(cli["out"].as<std::string>(), model);
            std::cout << "\nWrote " << cli["out"].as<std::string>() << '\n';
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    std::cout << "\nTook: " << ms << " ms\n";
    return 0;
}
