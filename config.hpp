#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <iostream>

#include "log.hpp"

namespace exptrack {

struct seed_transaction
{
	double amount = 0;
	std::string category;
};

struct config
{
	LogLevel log_level = LogLevel::INFO;
	std::string log_prefix = "exptrack";
	size_t feeders = 2;
	std::vector<seed_transaction> transactions;
	std::string filter_category;
	std::string filename;

	bool load(std::string filename_)
	{
		filename = std::move(filename_);

		std::ifstream infile(filename);
		if ( ! infile)
			return false;
		load(infile);
		return true;
	}

	void load(std::istream & in)
	{
		std::string line;
		while (std::getline(in, line))
		{
			std::istringstream iss(line);
			std::string type;
			iss >> type;
			if (type.empty() || type[0] == '#')
				continue;
			if (type == "log_level")
			{
				std::string level;
				if (iss >> level)
					log_level = parse_log_level(level);
			}
			else if (type == "log_prefix")
			{
				iss >> log_prefix;
			}
			else if (type == "feeders")
			{
				int n;
				if (iss >> n && n > 0)
					feeders = n;
			}
			else if (type == "transaction")
			{
				seed_transaction st;
				if (iss >> st.amount >> st.category)
					transactions.push_back(std::move(st));
			}
			else if (type == "filter_category")
			{
				iss >> filter_category;
			}
		}
	}
};

} // namespace
