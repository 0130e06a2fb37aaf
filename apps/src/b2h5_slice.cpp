// b2h5_slice: Read a slice of a Blosc2-compressed HDF5 dataset

#include <boost/program_options.hpp>
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "b2h5/core/h5/H5Dataset.hpp"
#include "b2h5/core/slicing/SliceReadEngine.hpp"
#include "b2h5/core/util/Config.hpp"
#include "b2h5/core/util/Logging.hpp"

namespace po = boost::program_options;
namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace b2h5;

namespace
{

template <typename T>
void printAs(std::ostream& os, const std::uint8_t* p)
{
    T v;
    std::memcpy(&v, p, sizeof(T));
    if constexpr (sizeof(T) == 1) {
        os << static_cast<int>(v);
    } else {
        os << v;
    }
}

void printElement(std::ostream& os, const std::uint8_t* p, const ElementType& type)
{
    if (!type.nativeOrder) {
        os << "<" << type.size << " bytes>";
        return;
    }
    switch (type.dtype) {
        case Dtype::Int8: printAs<std::int8_t>(os, p); break;
        case Dtype::Int16: printAs<std::int16_t>(os, p); break;
        case Dtype::Int32: printAs<std::int32_t>(os, p); break;
        case Dtype::Int64: printAs<std::int64_t>(os, p); break;
        case Dtype::UInt8: printAs<std::uint8_t>(os, p); break;
        case Dtype::UInt16: printAs<std::uint16_t>(os, p); break;
        case Dtype::UInt32: printAs<std::uint32_t>(os, p); break;
        case Dtype::UInt64: printAs<std::uint64_t>(os, p); break;
        case Dtype::Float32: printAs<float>(os, p); break;
        case Dtype::Float64: printAs<double>(os, p); break;
        default: os << "<" << type.size << " bytes>"; break;
    }
}

void printDataset(const B2Dataset& ds, const std::string& name)
{
    const auto& d = ds.descriptor();
    std::cout << "Dataset: " << name << " shape=" << shapeToString(d.shape)
              << " chunks=" << (d.chunked() ? shapeToString(d.chunkShape) : "contiguous")
              << " dtype=" << dtypeToString(d.dtype) << " filters=[";
    for (std::size_t i = 0; i < d.filters.size(); ++i) {
        std::cout << (i ? "," : "") << d.filters[i];
    }
    std::cout << "] fast=" << (ds.isFastAccess() ? "yes" : "no") << "\n";
}

}  // namespace

int main(int argc, char** argv)
{
    std::string filePath, datasetName, sliceText, configPath, logLevel, logFile, asType;
    int threads = 0;
    std::size_t maxValues = 20;

    po::options_description desc("b2h5_slice options");
    desc.add_options()
        ("help,h", "Show help")
        ("file,f", po::value<std::string>(&filePath)->required(),
         "Input HDF5 file")
        ("dataset,d", po::value<std::string>(&datasetName)->required(),
         "Dataset path inside the file")
        ("slice,s", po::value<std::string>(&sliceText)->default_value(""),
         "Slice expression, e.g. \"10:20, ..., 3\" (default: everything)")
        ("probe,p", "Only report whether the slice takes the chunk-direct path")
        ("astype,t", po::value<std::string>(&asType),
         "Result element type, e.g. <f8 (default: dataset type)")
        ("threads,j", po::value<int>(&threads),
         "Chunk reader threads (overrides --config)")
        ("config,c", po::value<std::string>(&configPath),
         "Engine configuration JSON file")
        ("max-values,n", po::value<std::size_t>(&maxValues)->default_value(20),
         "Number of values to print")
        ("log-level", po::value<std::string>(&logLevel)->default_value("warn"),
         "Log level: trace, debug, info, warn, error, critical, off")
        ("log-file", po::value<std::string>(&logFile),
         "Also write log messages to this file");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            std::cout << desc << "\n";
            return 0;
        }
        po::notify(vm);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n" << desc << "\n";
        return 1;
    }

    SetLogLevel(logLevel);
    if (!logFile.empty()) {
        AddLogFile(logFile);
    }

    try {
        EngineConfig config;
        if (!configPath.empty()) {
            std::ifstream in(configPath);
            if (!in) {
                std::cerr << "Cannot open config " << configPath << "\n";
                return 1;
            }
            config = EngineConfig::fromJson(json::parse(in));
        }
        if (vm.count("threads")) {
            if (threads < 1) {
                std::cerr << "--threads must be >= 1\n";
                return 1;
            }
            config.numThreads = threads;
        }

        auto source = std::make_shared<H5Dataset>(fs::path(filePath), datasetName);
        B2Dataset ds(source, config);
        printDataset(ds, datasetName);

        const auto expr = parseSliceExpr(sliceText);
        if (vm.count("probe")) {
            auto verdict = ds.checkEligible(expr);
            if (const auto* ok = std::get_if<Eligible>(&verdict)) {
                std::cout << "Slice [" << toString(expr) << "]: chunk-direct, output shape "
                          << shapeToString(ok->selection.outputShape) << "\n";
            } else {
                const auto& no = std::get<Ineligible>(verdict);
                std::cout << "Slice [" << toString(expr) << "]: generic ("
                          << toString(no.reason) << ") " << no.message << "\n";
            }
            return 0;
        }

        std::optional<ElementType> type;
        if (!asType.empty()) {
            type = dtypeFromString(asType);
        }

        auto result = ds.read(expr, type);
        if (const auto* s = std::get_if<Scalar>(&result)) {
            std::cout << "Scalar " << dtypeToString(s->type()) << ": ";
            printElement(std::cout, s->bytes().data(), s->type());
            std::cout << "\n";
        } else {
            const auto& a = std::get<NDArray>(result);
            std::cout << "Array shape=" << shapeToString(a.shape())
                      << " dtype=" << dtypeToString(a.type()) << "\n";
            const auto n = std::min(a.size(), maxValues);
            for (std::size_t i = 0; i < n; ++i) {
                std::cout << (i ? " " : "");
                printElement(std::cout, a.data() + i * a.type().size, a.type());
            }
            if (n < a.size()) {
                std::cout << " ... (" << a.size() << " values)";
            }
            std::cout << "\n";
        }

        const auto stats = ds.stats();
        Logger()->info(
            "optimized reads {}, fallback reads {}, chunks {}",
            stats.optimizedReads, stats.fallbackReads, stats.chunksRead);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
