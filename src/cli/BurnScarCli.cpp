#include"../Pipeline.hpp"
#include"../CatalogImageryProvider.hpp"
#include"../Log.hpp"
#include<iostream>

using namespace burnscar;

namespace {

	constexpr index_t DNBR_NODATA = -9999;
	constexpr class_t CLASSIFIED_NODATA = -1;

	struct CliArgs {
		std::string configFile;
		std::optional<std::string> logLevel;
		bool help = false;
	};

	void printUsage(std::ostream& os) {
		os << "usage: burnscar_cli <config.yaml> [--log-level trace|debug|info|warn|err|critical|off]\n";
	}

	CliArgs parseArgs(int argc, char* argv[]) {
		CliArgs out;
		for (int i = 1; i < argc; ++i) {
			std::string arg = argv[i];
			if (arg == "-h" || arg == "--help") {
				out.help = true;
			}
			else if (arg == "--log-level") {
				if (i + 1 >= argc) {
					throw InvalidConfigurationException("--log-level needs a value");
				}
				out.logLevel = argv[++i];
			}
			else if (arg.rfind("--", 0) == 0) {
				throw InvalidConfigurationException("Unknown option: " + arg);
			}
			else if (out.configFile.empty()) {
				out.configFile = arg;
			}
			else {
				throw InvalidConfigurationException("Only one config file may be given");
			}
		}
		if (!out.help && out.configFile.empty()) {
			throw InvalidConfigurationException("No config file given");
		}
		return out;
	}

	void logSummary(const BurnSeverityResult& result) {
		logger()->info("{}: {} images composited; {}: {} images composited",
			result.preFire.name, result.preFire.nImages, result.postFire.name, result.postFire.nImages);
		for (const ClassSummary& c : result.summary.classes) {
			logger()->info("  {:>2} {:<24} {} {:>10} cells {:>14.1f} area", c.classId, c.label, c.color, c.nCells, c.area);
		}
		logger()->info("  no data: {} cells", result.summary.nNoData);
	}

	int runCli(const CliArgs& args) {
		BurnScarConfig cfg = loadConfig(args.configFile);
		setLogLevel(args.logLevel ? *args.logLevel : cfg.logLevel);

		if (cfg.catalogFile.empty()) {
			throw InvalidConfigurationException("The config must name a scene catalog");
		}
		CatalogImageryProvider provider{ std::filesystem::path(cfg.catalogFile), cfg.sensors };

		BurnSeverityPipeline pipeline{ cfg.sensors, provider };
		if (cfg.water.seasonalityFile.size()) {
			logger()->info("Reading water seasonality from {}", cfg.water.seasonalityFile);
			pipeline.setSeasonality(Raster<seasonality_t>(cfg.water.seasonalityFile));
		}

		BurnSeverityResult result = pipeline.run(PipelineSettings::fromConfig(cfg));
		logSummary(result);

		if (cfg.output.dnbrFile.size()) {
			result.dnbr.writeRaster(cfg.output.dnbrFile, "GTiff", DNBR_NODATA, GDT_Float64);
			logger()->info("Wrote dNBR to {}", cfg.output.dnbrFile);
		}
		if (cfg.output.classifiedFile.size()) {
			result.classified.writeRaster(cfg.output.classifiedFile, "GTiff", CLASSIFIED_NODATA, GDT_Int16);
			logger()->info("Wrote severity classes to {}", cfg.output.classifiedFile);
		}
		return 0;
	}
}

int main(int argc, char* argv[]) {
	CliArgs args;
	try {
		args = parseArgs(argc, argv);
	}
	catch (const BurnScarException& e) {
		std::cerr << e.what() << "\n";
		printUsage(std::cerr);
		return 2;
	}
	if (args.help) {
		printUsage(std::cout);
		return 0;
	}

	try {
		return runCli(args);
	}
	catch (const BurnScarException& e) {
		logger()->error("{}", e.what());
		return 1;
	}
	catch (const std::exception& e) {
		logger()->critical("Unexpected error: {}", e.what());
		return 1;
	}
}
