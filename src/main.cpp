#include "spectra.hpp"
#include <cxxopts.hpp>
#include <filesystem>
#include <vector>
#include <string>
#include <cstring>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <atomic>
#include <thread>
#include <algorithm>
#include "utils.hpp"
#include "io.hpp"

#ifdef WITH_TBB
#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#endif

using namespace specfact;

void printVersion() {
    std::cout << "\033[1;36mSpectrumFactory\033[0m (\033[1mspecfact\033[0m) v0.1.0" << std::endl;
}

void printHelp(const cxxopts::Options& options) {
    std::cout << options.help() << std::endl;
}

void printPeakTable(const std::string& descriptor, const SpectrumResult& result) {
    std::cout << "\033[1;36m" << modalityToString(resultModality(result));
    if (const auto* nmr = std::get_if<NMRSpectrum>(&result)) {
        std::cout << " (" << nucleusToString(nmr->nucleus) << ")";
    }
    std::cout << "\033[0m peaks for \033[1m" << descriptor << "\033[0m" << std::endl;

    if (peakCount(result) == 0) {
        std::cout << "  (no peaks)" << std::endl;
        return;
    }

    std::cout << std::fixed;
    if (const auto* nmr = std::get_if<NMRSpectrum>(&result)) {
        std::cout << "  " << std::left << std::setw(10) << "ppm" << std::setw(11) << "intensity"
                  << std::setw(6) << "mult" << std::setw(10) << "atoms" << "assignment" << std::endl;
        for (const auto& peak : nmr->peaks) {
            std::string atoms;
            for (size_t i = 0; i < peak.atomIds.size(); ++i) {
                atoms += (i > 0 ? "," : "") + std::to_string(peak.atomIds[i]);
            }
            std::cout << "  \033[1;32m" << std::setw(10) << std::setprecision(2) << peak.shift << "\033[0m"
                      << std::setw(11) << std::setprecision(3) << peak.intensity
                      << std::setw(6) << peak.multiplicity << std::setw(10) << atoms << peak.label << std::endl;
        }
        return;
    }

    const bool ir = std::holds_alternative<IRSpectrum>(result);
    const auto& peaks = ir ? std::get<IRSpectrum>(result).peaks : std::get<UVSpectrum>(result).peaks;
    std::cout << "  " << std::left << std::setw(12) << (ir ? "cm-1" : "nm")
              << std::setw(12) << (ir ? "%T" : "A") << "assignment" << std::endl;
    for (const auto& peak : peaks) {
        std::cout << "  \033[1;32m" << std::setw(12) << std::setprecision(1) << peak.x << "\033[0m"
                  << std::setw(12) << std::setprecision(ir ? 1 : 4) << peak.y << peak.label << std::endl;
    }
}

// RDKit is only consulted to warn; synthesis always runs on the raw string.
void checkDescriptor(const std::string& smiles) {
    if (smiles.empty()) return;
    Molecule mol(smiles);
    if (!mol.isValid()) {
        globalLogger.warning("RDKit could not parse '" + smiles + "' (" + mol.getErrorMessage() +
                             "); synthesizing from the raw string");
        return;
    }
    globalLogger.debug("Canonical SMILES " + mol.getSmiles() + ", " +
                       std::to_string(mol.getNumHeavyAtoms()) + " heavy atoms");
}

int runSingle(const SpectrumFactory& factory, const std::string& smiles, Modality modality, Nucleus nucleus,
              const cxxopts::ParseResult& result) {
    checkDescriptor(smiles);

    spectra::RandomSource rng(globalConfig.seed);
    SpectrumResult spectrum = factory.synthesize(smiles, modality, nucleus, rng);
    printPeakTable(smiles, spectrum);

    if (result.count("output")) {
        const std::string outputPath = result["output"].as<std::string>();
        writeJsonFile(outputPath, spectrumToJson(smiles, spectrum, globalConfig.seed));
        std::cout << "\033[1;32m✓\033[0m Spectrum written to \033[1m" << outputPath << "\033[0m" << std::endl;
    }
    if (result.count("curve")) {
        const std::string curvePath = result["curve"].as<std::string>();
        writeCurveCsv(curvePath, spectrum);
        std::cout << "\033[1;32m✓\033[0m Curve written to \033[1m" << curvePath << "\033[0m" << std::endl;
    }
    return 0;
}

int runBatch(const SpectrumFactory& factory, Modality modality, Nucleus nucleus,
             const cxxopts::ParseResult& result) {
    const std::string inputPath = result["input"].as<std::string>();
    const std::string outputPath = result["output"].as<std::string>();
    const std::string smilesColumn = result["smiles-column"].as<std::string>();
    const std::string delimiter = result["delimiter"].as<std::string>();
    const bool hasHeader = !result.count("no-header");

    if (!std::filesystem::exists(std::filesystem::path(inputPath))) {
        globalLogger.error("Input file does not exist: " + inputPath);
        return 1;
    }

    if (!globalConfig.verbose) {
        std::cout << "\033[1;36mProcessing:\033[0m " << inputPath << " → " << outputPath << std::endl;
    }

    CsvIO csvInputHandler(inputPath, outputPath, delimiter, smilesColumn, hasHeader);
    CsvIO::ResultWriter resultWriter = csvInputHandler.createResultWriter();
    CsvIO::LineReader lineReader = csvInputHandler.createLineReader();

    size_t estimatedLines = lineReader.getEstimatedLines();
    if (estimatedLines == 0) {
        globalLogger.warning("No data rows found in " + inputPath);
        estimatedLines = 1;
    }

    ProgressBar progressBar(estimatedLines, "Synthesizing", 50);
    progressBar.start();
    auto startTime = std::chrono::steady_clock::now();

    const size_t effectiveBatchSize = std::max<size_t>(1, globalConfig.batchSize);
    size_t processedCount = 0;
    std::atomic<size_t> unparsedCount{0};
    RowBatch batch;

    while (lineReader.readBatch(batch, effectiveBatchSize)) {
        std::vector<SpectrumResult> results(batch.size());

        auto synthesizeRow = [&](size_t i) {
            const std::string& smiles = batch.descriptors[i];
            const size_t row = batch.firstRow + i;
            if (!smiles.empty() && !Molecule(smiles).isValid()) {
                unparsedCount.fetch_add(1, std::memory_order_relaxed);
                globalLogger.debug("RDKit could not parse row " + std::to_string(row) + ": " + smiles);
            }
            // One stream per row keeps output independent of scheduling.
            spectra::RandomSource rng = spectra::RandomSource::forStream(globalConfig.seed, row);
            results[i] = factory.synthesize(smiles, modality, nucleus, rng);
        };

#ifdef WITH_TBB
        if (globalConfig.numThreads > 1) {
            tbb::parallel_for(tbb::blocked_range<size_t>(0, batch.size()),
                [&](const tbb::blocked_range<size_t>& range) {
                    for (size_t i = range.begin(); i != range.end(); ++i) {
                        synthesizeRow(i);
                    }
                });
        } else {
            for (size_t i = 0; i < batch.size(); ++i) synthesizeRow(i);
        }
#else
        for (size_t i = 0; i < batch.size(); ++i) synthesizeRow(i);
#endif

        const size_t rowsBefore = resultWriter.getRowsWritten();
        if (!resultWriter.writeBatch(batch, results)) {
            progressBar.finish();
            throw SpectrumException("Failed writing results to " + outputPath, ErrorCode::IO_ERROR);
        }
        progressBar.update(batch.size(), resultWriter.getRowsWritten() - rowsBefore);
        processedCount += batch.size();
    }
    resultWriter.flush();

    progressBar.finish();
    auto endTime = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime);

    if (unparsedCount > 0) {
        globalLogger.warning(std::to_string(unparsedCount.load()) +
                             " descriptors could not be parsed by RDKit; spectra were synthesized from the raw strings");
    }
    std::cout << "\033[1;32m✓\033[0m Processed \033[1m" << processedCount << "\033[0m molecules" << std::endl;
    std::cout << "\033[1;32m✓\033[0m Wrote \033[1m" << resultWriter.getRowsWritten() << "\033[0m peak rows to \033[1m"
              << outputPath << "\033[0m" << std::endl;
    std::cout << "\033[1;32m✓\033[0m Total processing time: \033[1m" << (duration.count() / 1000.0) << "\033[0m seconds" << std::endl;

    globalLogger.info("Batch complete: " + std::to_string(processedCount) + " molecules, seed " +
                      std::to_string(globalConfig.seed));
    return 0;
}

int main(int argc, char* argv[]) {
    cxxopts::Options options("\033[1;36mspecfact\033[0m", "Heuristic IR, UV-Vis and NMR spectrum synthesis from SMILES");

    options.add_options("Basic")
        ("h,help", "Display help information")
        ("v,version", "Display version information")
        ("l,list", "List available synthesizers");

    options.add_options("Spectrum")
        ("s,smiles", "Synthesize a single SMILES descriptor", cxxopts::value<std::string>())
        ("m,modality", "Spectrum type: ir, uv or nmr", cxxopts::value<std::string>()->default_value("ir"))
        ("nucleus", "NMR nucleus: 1H or 13C", cxxopts::value<std::string>()->default_value("1H"))
        ("seed", "Random seed (0 = random)", cxxopts::value<uint64_t>()->default_value("0"))
        ("curve", "Write the curve as CSV (single mode)", cxxopts::value<std::string>());

    options.add_options("Input/Output")
        ("i,input", "Input CSV file path", cxxopts::value<std::string>())
        ("o,output", "Output path: JSON in single mode, CSV in batch mode", cxxopts::value<std::string>());

    options.add_options("CSV Options")
        ("smiles-column", "Name (or index) of the column containing SMILES", cxxopts::value<std::string>()->default_value("SMILES"))
        ("delimiter", "CSV delimiter character", cxxopts::value<std::string>()->default_value(","))
        ("no-header", "Input CSV file has no header");

    options.add_options("Performance")
        ("b,batch-size", "Number of molecules to process per batch", cxxopts::value<size_t>())
        ("t,threads", "Number of parallel threads (0=auto)", cxxopts::value<int>())
        ("verbose", "Enable detailed logging output")
        ("log-level", "Minimum log level: DEBUG, INFO, WARNING, ERROR", cxxopts::value<std::string>()->default_value("WARNING"));

    options.set_width(100);

    if (argc == 1 || (argc > 1 && (strcmp(argv[1], "-h") == 0 || strcmp(argv[1], "--help") == 0))) {
        printHelp(options);
        return 0;
    }

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) { printHelp(options); return 0; }
        if (result.count("version")) { printVersion(); return 0; }

        globalConfig.numThreads = result.count("threads") ? result["threads"].as<int>() : 0;
        globalConfig.verbose = result.count("verbose") > 0;
        globalConfig.batchSize = result.count("batch-size") ? result["batch-size"].as<size_t>() : 64;
        globalConfig.seed = util::resolveSeed(result["seed"].as<uint64_t>());

        globalConfig.logLevel = globalConfig.verbose ? "DEBUG" : result["log-level"].as<std::string>();
        globalLogger.setMinLevel(parseLogLevel(globalConfig.logLevel));
        if (globalConfig.verbose) {
            globalLogger.info("Verbose mode enabled.");
            globalLogger.info("Processing in batches of " + std::to_string(globalConfig.batchSize));
        }
        globalLogger.info("Using seed " + std::to_string(globalConfig.seed));

        if (globalConfig.numThreads <= 0) {
            int availableCores = static_cast<int>(std::thread::hardware_concurrency());
            globalConfig.numThreads = availableCores > 1 ? availableCores - 1 : 1;
            globalLogger.info("Auto-configured to use " + std::to_string(globalConfig.numThreads) + " threads.");
        }

#ifdef WITH_TBB
        tbb::global_control global_limit(
            tbb::global_control::max_allowed_parallelism,
            static_cast<size_t>(globalConfig.numThreads)
        );
        globalLogger.debug("TBB configured with " + std::to_string(globalConfig.numThreads) + " threads");
#else
        if (globalConfig.numThreads > 1) {
            globalLogger.warning("TBB not enabled. Running single-threaded.");
            globalConfig.numThreads = 1;
        }
#endif

        SpectrumFactory factory;

        if (result.count("list")) {
            std::cout << "\033[1;36mAvailable synthesizers:\033[0m" << std::endl;
            const size_t nameColumn = 12;
            for (const auto& name : factory.getAvailableSynthesizers()) {
                const SpectrumSynthesizer* synthesizer = factory.getSynthesizer(name);
                std::cout << "\033[1;32m" << std::left << std::setw(nameColumn) << name << "\033[0m"
                          << synthesizer->getDescription() << std::endl;
            }
            return 0;
        }

        const Modality modality = parseModality(result["modality"].as<std::string>());
        const Nucleus nucleus = parseNucleus(result["nucleus"].as<std::string>());

        if (result.count("smiles")) {
            return runSingle(factory, result["smiles"].as<std::string>(), modality, nucleus, result);
        }

        if (!result.count("input") || !result.count("output")) {
            std::cerr << "\033[1;31mError:\033[0m either --smiles, or both --input and --output, are required." << std::endl;
            printHelp(options);
            return 1;
        }
        return runBatch(factory, modality, nucleus, result);

    } catch (const cxxopts::exceptions::parsing& e) {
        std::cerr << "\033[1;31mError parsing options:\033[0m " << e.what() << std::endl;
        return 1;
    } catch (const SpectrumException& e) {
        std::cerr << "\033[1;31mSpectrum error (" << errorCodeToString(e.getCode()) << "):\033[0m "
                  << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "\033[1;31mError:\033[0m " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
