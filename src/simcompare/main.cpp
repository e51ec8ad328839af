#include "ComparisonConfiguration.h"
#include "DatasetGatherer.h"
#include "DistributionAnalyzer.h"
#include "ImplementationComparator.h"
#include "ImplementationSet.h"
#include "OutputAverager.h"
#include "PairwiseConflictMatrix.h"
#include "ParallelExecutors.h"
#include "ReportPrinter.h"
#include "ResultSerializer.h"
#include "SimStatsException.h"
#include "SummaryExtractorFactory.h"
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>

namespace po = boost::program_options;
using namespace simcompare;

namespace {

void printUsage(const po::options_description& desc) {
    std::cout << "simcompare - statistical comparison of simulation model implementations\n\n";
    std::cout << "Usage: simcompare [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  # Run everything described in a configuration file\n";
    std::cout << "  simcompare --config run.json --analyze --compare --pairwise --json results.json\n\n";
    std::cout << "  # Compare two implementations, 6 outputs, steady state from iteration 1001\n";
    std::cout << "  simcompare --impl NL --folder data/nl --files \"stats*.txt\" \\\n";
    std::cout << "             --impl J --folder data/j --files \"stats*.txt\" \\\n";
    std::cout << "             --outputs 6 --ss-start 1001 --compare --tests p,np,p,np,p,p\n\n";
    std::cout << "  # Snapshot summaries at given iterations\n";
    std::cout << "  simcompare --config run.json --extractor iterations --iterations 100,500,1000\n\n";
    std::cout << "  # Averaged output series with a 10-iteration moving average\n";
    std::cout << "  simcompare --config run.json --average --window 10\n";
}

std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> items;
    boost::split(items, text, boost::is_any_of(","), boost::token_compress_on);

    std::vector<std::string> result;
    for (auto& item : items) {
        boost::trim(item);
        if (!item.empty())
            result.push_back(item);
    }
    return result;
}

OutputNames parseOutputs(const std::string& text) {
    const std::vector<std::string> items = splitList(text);
    if (items.size() == 1) {
        try {
            return OutputNames::fromCount(boost::lexical_cast<std::size_t>(items.front()));
        } catch (const boost::bad_lexical_cast&) {
            // a single output name
        }
    }
    return OutputNames::fromList(items);
}

std::vector<std::size_t> parseIterations(const std::string& text) {
    std::vector<std::size_t> iterations;
    for (const auto& item : splitList(text)) {
        try {
            iterations.push_back(boost::lexical_cast<std::size_t>(item));
        } catch (const boost::bad_lexical_cast&) {
            throw ConfigurationException("--iterations: '" + item + "' is not a non-negative integer");
        }
    }
    return iterations;
}

TestSelector parseTests(const std::string& text) {
    TestSelector tests;
    for (const auto& item : splitList(text))
        tests.push_back(parseTestKind(item));
    return tests;
}

std::vector<std::string> getList(const po::variables_map& vm, const char* name) {
    if (!vm.count(name))
        return {};
    return vm[name].as<std::vector<std::string>>();
}

ComparisonConfiguration configurationFromCommandLine(const po::variables_map& vm) {
    ImplementationSet implementations = ImplementationSet::fromLists(getList(vm, "impl"),
                                                                     getList(vm, "folder"),
                                                                     getList(vm, "files"));
    if (implementations.empty())
        throw ConfigurationException("No implementations given (use --config or --impl/--folder/--files)");
    if (!vm.count("outputs"))
        throw ConfigurationException("--outputs is required without --config");

    ExtractorSettings extractor;
    extractor.kind = SummaryExtractorFactory::parseKind(vm["extractor"].as<std::string>());
    extractor.steadyStateStart = vm["ss-start"].as<std::size_t>();
    if (vm.count("iterations"))
        extractor.iterations = parseIterations(vm["iterations"].as<std::string>());

    return ComparisonConfiguration(implementations,
                                   parseOutputs(vm["outputs"].as<std::string>()),
                                   extractor,
                                   vm.count("alpha") ? vm["alpha"].as<double>() : 0.05,
                                   vm.count("tests") ? parseTests(vm["tests"].as<std::string>()) : TestSelector(),
                                   vm.count("threads") ? vm["threads"].as<std::size_t>() : 1);
}

// --alpha, --tests, --threads and --extractor/--iterations override a configuration file.
ComparisonConfiguration applyOverrides(const ComparisonConfiguration& base, const po::variables_map& vm) {
    ExtractorSettings extractor = base.getExtractorSettings();
    if (!vm["extractor"].defaulted())
        extractor.kind = SummaryExtractorFactory::parseKind(vm["extractor"].as<std::string>());
    if (!vm["ss-start"].defaulted())
        extractor.steadyStateStart = vm["ss-start"].as<std::size_t>();
    if (vm.count("iterations"))
        extractor.iterations = parseIterations(vm["iterations"].as<std::string>());

    TestSelector tests;
    if (vm.count("tests"))
        tests = parseTests(vm["tests"].as<std::string>());
    else if (base.hasExplicitTests())
        tests = base.getTestSelector(0);

    return ComparisonConfiguration(base.getImplementations(),
                                   base.getOutputs(),
                                   extractor,
                                   vm.count("alpha") ? vm["alpha"].as<double>() : base.getAlpha(),
                                   tests,
                                   vm.count("threads") ? vm["threads"].as<std::size_t>() : base.getNumThreads());
}

} // namespace

int main(int argc, char* argv[]) {
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show help message")
        ("config,c", po::value<std::string>(), "JSON configuration file describing the run")
        ("impl", po::value<std::vector<std::string>>()->composing(), "Implementation name (repeatable)")
        ("folder", po::value<std::vector<std::string>>()->composing(), "Folder holding an implementation's output files (repeatable)")
        ("files", po::value<std::vector<std::string>>()->composing(), "File name pattern with * and ? (repeatable)")
        ("outputs", po::value<std::string>(), "Number of outputs, or a comma separated list of output names")
        ("extractor", po::value<std::string>()->default_value("steady-state"), "Summary extractor: steady-state or iterations")
        ("ss-start", po::value<std::size_t>()->default_value(1), "First steady-state iteration (1-based)")
        ("iterations", po::value<std::string>(), "Comma separated snapshot iterations (1-based)")
        ("alpha", po::value<double>(), "Significance level (default 0.05)")
        ("tests", po::value<std::string>(), "Comma separated p/np per summary (default all p)")
        ("threads", po::value<std::size_t>(), "Worker threads for reading files (0 = hardware, default 1)")
        ("analyze", "Analyse the distribution of every focal measure")
        ("compare", "Test all implementations jointly")
        ("pairwise", "Build the pairwise conflict matrix")
        ("average", "Print the averaged output series of each implementation")
        ("window", po::value<std::size_t>()->default_value(0), "Moving-average window for --average")
        ("avg-iterations", po::value<std::size_t>()->default_value(0), "Iterations to average (0 = length of the first file)")
        ("json", po::value<std::string>(), "Write results as JSON to this file")
        ("verbose,v", "Verbose output");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(desc);
        return 1;
    }

    if (vm.count("help") || argc == 1) {
        printUsage(desc);
        return 0;
    }

    const bool verbose = vm.count("verbose") > 0;
    bool doAnalyze = vm.count("analyze") > 0;
    bool doCompare = vm.count("compare") > 0;
    const bool doPairwise = vm.count("pairwise") > 0;
    const bool doAverage = vm.count("average") > 0;

    if (!doAnalyze && !doCompare && !doPairwise && !doAverage) {
        doAnalyze = true;
        doCompare = true;
    }

    try {
        const ComparisonConfiguration config = vm.count("config")
            ? applyOverrides(ComparisonConfiguration::loadFromFile(vm["config"].as<std::string>()), vm)
            : configurationFromCommandLine(vm);

        const ImplementationSet& implementations = config.getImplementations();
        ReportPrinter printer(std::cout);

        if (verbose) {
            std::cout << "Implementations: " << implementations.size()
                      << ", outputs: " << config.getOutputs().size()
                      << ", alpha: " << config.getAlpha()
                      << ", threads: " << config.getNumThreads() << std::endl;
        }

        if (doAverage) {
            AveragingOptions options;
            options.windowSize = vm["window"].as<std::size_t>();
            options.iterations = vm["avg-iterations"].as<std::size_t>();

            OutputAverager averager;
            printer.printAverages(averager.average(implementations, config.getOutputs(), options),
                                  implementations.getNames(),
                                  config.getOutputs());
        }

        if (!doAnalyze && !doCompare && !doPairwise)
            return 0;

        auto extractor = SummaryExtractorFactory::create(config.getExtractorSettings());
        DatasetGatherer gatherer(extractor);
        auto executor = concurrency::makeExecutor(config.getNumThreads());

        if (verbose)
            std::cout << "Gathering with the " << extractor->getName() << " extractor" << std::endl;

        RunResults results;
        results.datasets = implementations.gatherAll(gatherer, config.getOutputs(), *executor);
        for (const auto& dataset : results.datasets)
            printer.printDatasetSummary(dataset);

        if (doAnalyze) {
            for (const auto& dataset : results.datasets) {
                results.analyses.push_back(DistributionAnalyzer::analyze(dataset, config.getAlpha()));
                printer.printAnalysis(results.analyses.back(), dataset);
            }
        }

        const TestSelector selector = config.getTestSelector(extractor->getNumSummaries());
        std::unique_ptr<ComparisonResult> comparison;
        std::unique_ptr<ConflictMatrix> conflicts;

        if ((doCompare || doPairwise) && results.datasets.size() < 2) {
            std::cerr << "Warning: comparison needs at least two implementations, skipping" << std::endl;
        } else {
            if (doCompare) {
                comparison = std::make_unique<ComparisonResult>(
                    ImplementationComparator::compare(config.getAlpha(), selector, results.datasets));
                printer.printComparison(*comparison, results.datasets.front());
                results.comparison = comparison.get();
            }

            if (doPairwise) {
                conflicts = std::make_unique<ConflictMatrix>(
                    PairwiseConflictMatrixBuilder::build(config.getAlpha(), selector, results.datasets));
                printer.printConflicts(*conflicts);
                results.conflicts = conflicts.get();
            }
        }

        if (vm.count("json")) {
            const std::string jsonPath = vm["json"].as<std::string>();
            ResultSerializer::saveToFile(results, jsonPath);
            if (verbose)
                std::cout << "Results written to " << jsonPath << std::endl;
        }
    } catch (const SimStatsException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
