#pragma once

#include<cstddef>
#include<fstream>
#include<set>
#include<string>
#include<vector>

namespace cli_util{

struct OutTgt{
	std::ofstream file;
	std::ostream*stream=nullptr;
};

struct BatchLine{
	int line_no=0;
	std::string raw;
};

bool is_opt(const std::string&s);

bool is_help(const std::vector<std::string>&args);

std::string to_low(std::string s);

bool parse_bool01(const std::string&text,const std::string&label);

std::string req_val(const std::vector<std::string>&args,std::size_t&idx,
					const std::string&opt);

OutTgt open_out(const std::string&path);

void note_out(const std::string&path,bool quiet);

void chk_fmt(const std::string&format,const std::set<std::string>&allowed,
			 const std::string&ctx);

std::string csv_quote(const std::string&s);

std::vector<BatchLine> read_bat(bool from_stdin,const std::string&input_file);

} // namespace cli_util
