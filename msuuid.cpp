#include "config.hpp"
#include "microshard.hpp"
#include <cxxopts.hpp>
#include <glog/logging.h>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

// msuuid: mint and inspect MicroShard UUIDs from the shell.
//
//   msuuid generate --shard 7 --count 3
//   msuuid from-micros 1672531200000000 --shard 7
//   msuuid from-iso 2023-01-01T00:00:00.123456Z --shard 7
//   msuuid inspect 17c4a210-3500-8000-8000-001000000000

namespace{
	using microshard::uuid_t;

	int report(const microshard::error& err){
		LOG(ERROR) << err;
		return 1;
	}

	int print(const microshard::result<uuid_t>& id){
		if(!id){
			return report(id.error());
		}
		std::cout << *id << '\n';
		return 0;
	}

	int generate(std::uint32_t shard, std::size_t count){
		auto source = microshard::entropy_source{};
		VLOG(1) << "Generating " << count << " id(s) for shard " << shard;
		for(std::size_t i = 0; i < count; ++i){
			if(const int rc = print(uuid_t::generate(shard, source)); rc != 0){
				return rc;
			}
		}
		return 0;
	}

	int from_micros(const std::string& arg, std::uint32_t shard){
		std::uint64_t micros{};
		auto rc = std::from_chars(arg.data(), arg.data() + arg.size(), micros);
		if(rc.ec != std::errc{} || rc.ptr != arg.data() + arg.size()){
			LOG(ERROR) << "Not a microsecond timestamp: " << arg;
			return 1;
		}
		return print(uuid_t::from_micros(micros, shard));
	}

	int inspect(const std::string& arg){
		const auto id = uuid_t::from_string(arg);
		if(!id){
			return report(id.error());
		}
		std::cout << "uuid    " << *id << '\n'
			<< "shard   " << id->shard_id() << '\n'
			<< "micros  " << id->timestamp_micros() << '\n'
			<< "time    " << id->to_iso_string() << '\n'
			<< "random  " << id->random_bits() << '\n';
		return 0;
	}
} //namespace

int main(int argc, char* argv[]){
	google::InitGoogleLogging(argv[0]);
	FLAGS_logtostderr = 1; // console only, no log files

	const microshard::tool_config config{};

	cxxopts::Options options("msuuid", "Generate and inspect MicroShard UUIDs");
	options.add_options()
		("command", "generate | from-micros | from-iso | inspect", cxxopts::value<std::string>())
		("args", "Argument of the command", cxxopts::value<std::vector<std::string>>())
		("s,shard", "Shard id (default: $" + std::string{config.shard_id.env_var()} + " or 0)", cxxopts::value<std::uint32_t>())
		("n,count", "Number of ids to generate", cxxopts::value<std::size_t>()->default_value("1"))
		("l,log_level", "Verbose log level (default: $" + std::string{config.verbosity.env_var()} + " or 0)", cxxopts::value<int>())
		("h,help", "Print usage");
	options.parse_positional({"command", "args"});
	options.positional_help("<command> [argument]");

	try{
		const auto result = options.parse(argc, argv);
		if(result.count("help") || !result.count("command")){
			std::cout << options.help() << std::endl;
			return result.count("help") ? 0 : 1;
		}

		FLAGS_v = result.count("log_level") ? result["log_level"].as<int>() : config.verbosity.get();
		const std::uint32_t shard = result.count("shard") ? result["shard"].as<std::uint32_t>() : config.shard_id.get();
		const auto command = result["command"].as<std::string>();
		const auto args = result.count("args") ? result["args"].as<std::vector<std::string>>() : std::vector<std::string>{};
		VLOG(1) << "command=" << command << " shard=" << shard;

		if(command == "generate"){
			return generate(shard, result["count"].as<std::size_t>());
		}
		if(args.size() != 1){
			LOG(ERROR) << command << " takes exactly one argument";
			return 1;
		}
		if(command == "from-micros"){
			return from_micros(args.front(), shard);
		}
		if(command == "from-iso"){
			return print(uuid_t::from_iso(args.front(), shard));
		}
		if(command == "inspect"){
			return inspect(args.front());
		}
		LOG(ERROR) << "Unknown command: " << command;
		return 1;
	} catch(const std::exception& e){
		LOG(ERROR) << "Invalid arguments: " << e.what();
		return 1;
	}
}
