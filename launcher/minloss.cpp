//============================================================================
// Name        : minloss.cpp
// Author      : Maciej Kozarzewski
// Description : Computes loss and gradient for a batch stored in a json file
//============================================================================

#include <minloss/training/LossFunction.hpp>
#include <minloss/training/evaluate.hpp>
#include <minloss/utils/file_util.hpp>
#include <minloss/utils/json.hpp>
#include <minloss/utils/string_util.hpp>
#include <minloss/utils/version.hpp>

#include <memory>
#include <stdexcept>
#include <string>

using namespace mls;

namespace
{
	void print_help()
	{
		println("Usage: minloss <config.json> <batch.json>");
		println("  config.json  loss configuration, for example {\"name\": \"CosineDistance.v1\", \"normalize\": true}");
		println("  batch.json   {\"guesses\": [[...], ...], \"targets\": [[...], ...]}, targets may also be a flat array of class indices");
		println("               for SequenceCategoricalCrossentropy both fields are lists with one such entry per sequence position");
		println("Options:");
		println("  -h, --help     print this message");
		println("  -v, --version  print version");
	}
}

int main(int argc, char *argv[])
{
	if (argc == 2 and (std::string(argv[1]) == "-h" or std::string(argv[1]) == "--help"))
	{
		print_help();
		return 0;
	}
	if (argc == 2 and (std::string(argv[1]) == "-v" or std::string(argv[1]) == "--version"))
	{
		println("minloss " + getVersion().toString());
		return 0;
	}
	if (argc != 3)
	{
		printerr("expected 2 arguments, got " + std::to_string(argc - 1));
		print_help();
		return 1;
	}

	try
	{
		const std::unique_ptr<LossFunction> loss = loadLoss(loadJsonFile(argv[1]));
		const Json batch = loadJsonFile(argv[2]);

		Json result = evaluateLoss(*loss, batch);
		Json output(JsonType::Object);
		output["config"] = loss->getConfig();
		output["loss"] = result["loss"];
		output["gradient"] = result["gradient"];
		println(output.dump(2));
	} catch (std::exception &e)
	{
		printerr(e.what());
		return 1;
	}
	return 0;
}
