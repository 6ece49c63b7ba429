#pragma once

#include<stdexcept>
#include<string>
#include<tuple>

struct ParseError : std::invalid_argument{
	using std::invalid_argument::invalid_argument;
};

long long parse_num(const std::string&text,const std::string&label);

std::string fmt_year(long long year);

std::string fmt_ymd(long long year,int month,int day);

std::tuple<long long,int,int> parse_ymd(const std::string&s);

const char*dow_name(int dow);
