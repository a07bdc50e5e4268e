#include "etcalc/BatchRunner.hpp"
#include "etcalc/Log.hpp"
#include "etcalc/PipelineAssembler.hpp"
#include "etcalc/ReportUtils.hpp"
#include "etcalc/SceneLoader.hpp"

#include <cxxopts.hpp>
#include <Eigen/Core>

#include <chrono>
#include <iostream>
#include <thread>
#ifdef _OPENMP
#include <omp.h>
#endif

using namespace etcalc;

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    std::size_t failed = 0;
    try {
        cxxopts::Options opts("etcalc", "Exposure time calculator for astronomical instruments");
        opts.add_options()
            ("c,config", "Scene description JSON", cxxopts::value<std::string>())
            ("o,output", "Write the results as JSON", cxxopts::value<std::string>())
            ("threads", "Number of threads", cxxopts::value<int>()->default_value("0"))
            ("v,verbose", "Log the noise budget of every scenario")
            ("d,debug", "Debug output")
            ("h,help", "Show help");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help") || !cli.count("config")) {
            std::cout << opts.help() << '\n';
            return cli.count("help") ? 0 : 1;
        }

        if (cli.count("debug"))        log::set_level(log::Level::Debug);
        else if (cli.count("verbose")) log::set_level(log::Level::Info);

        int nthreads = cli["threads"].as<int>();
        if (nthreads <= 0) nthreads = static_cast<int>(std::thread::hardware_concurrency());
        if (nthreads <= 0) nthreads = 1;
#ifdef _OPENMP
        omp_set_num_threads(nthreads);
#endif
        Eigen::setNbThreads(1);

        // Scene -> pipeline
        const SceneDescription scene = SceneLoader::load_file(cli["config"].as<std::string>());
        const PipelineAssembler assembler(scene);
        const SensorPtr sensor = assembler.build_sensor();

        // Batch
        const auto scenarios = BatchRunner::plan(scene.common.exposure_times, scene.common.snrs);
        const BatchRunner runner(*sensor, static_cast<unsigned>(nthreads));
        const auto outcomes = runner.run(scenarios);

        for (const auto& o : outcomes) {
            if (!o.ok()) ++failed;
            std::cout << summary_line(o) << '\n';
        }

        if (cli.count("output"))
            write_report(cli["output"].as<std::string>(),
                         make_report(scene, sensor->name(), outcomes));

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    log::info("etcalc", "took " + std::to_string(ms) + " ms");

    if (failed) {
        std::cerr << failed << " scenario(s) failed\n";
        return 2;
    }
    return 0;
}
