#include <glog/logging.h>

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include <tChrono/SeriesConfigs>
#include <tChrono/TimeSeries>

namespace fs = std::filesystem;

void setupGlog(const char *name)
{
    constexpr char kLogDir[]{"Log"};

    const fs::path logDirPath{kLogDir};
    if (!fs::exists(logDirPath)) {
        fs::create_directories(logDirPath);
    }

    FLAGS_alsologtostderr = true;
    FLAGS_log_dir = kLogDir;
    ::google::InitGoogleLogging(name);
}

int main(int argc, char *argv[])
{
    setupGlog(argv[0]);

    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <configs.json>\n";
        return 1;
    }

    const std::string configsPath{argv[1]};
    tc::SeriesConfigs configs;
    if (!tc::SeriesConfigs::load(configsPath, configs)) {
        LOG(ERROR) << "Failed to load series configs from " << configsPath;
        return 1;
    }

    FLAGS_v = configs.logVerbosity;

    try {
        auto series = configs.createSeries();
        LOG(INFO) << series;

        std::size_t count{0};
        while (const auto epoch =
                   configs.reverse ? series.nextBack() : series.next()) {
            std::cout << tc::epoch::toString(*epoch) << '\n';
            ++count;
        }

        LOG(INFO) << count << " epochs generated.";
    }
    catch (const std::invalid_argument &e) {
        LOG(ERROR) << "Invalid time series: " << e.what();
        return 1;
    }

    return 0;
}
