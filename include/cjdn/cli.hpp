#pragma once

#include<string>
#include<vector>

#include "cjdn/calendar.hpp"

struct ToArgs{
	CalKind cal=CalKind::gregorian;
	std::string date_text;
	std::string year;
	std::string month;
	std::string day;
	bool strict=false;
	std::string format="txt";
	std::string out;
	bool pretty=true;
	bool quiet=false;
	bool from_stdin=false;
	std::string input_file;
};

// Single date -> CJDN. Returns 0.
int cli_to(const ToArgs&args);

// One date per line, "YYYY-MM-DD" or "Y M D". Returns 1 if any line failed.
int run_tbcli(const ToArgs&args);

struct FromArgs{
	CalKind cal=CalKind::gregorian;
	std::string cjdn_text;
	CjOpts opts;
	std::string format="txt";
	std::string out;
	bool pretty=true;
	bool quiet=false;
	bool from_stdin=false;
	std::string input_file;
};

int cli_from(const FromArgs&args);

int run_fbcli(const FromArgs&args);

struct ConvArgs{
	CalKind cal=CalKind::gregorian;
	std::string date_text;
	std::vector<CalKind> targets;
	bool strict=false;
	std::string format="txt";
	std::string out;
	bool pretty=true;
	bool quiet=false;
};

int cli_conv(const ConvArgs&args);

struct DowArgs{
	CalKind cal=CalKind::gregorian;
	std::string cjdn_text;
	std::string date_text;
	std::string format="txt";
	std::string out;
	bool pretty=true;
	bool quiet=false;
};

int cli_dow(const DowArgs&args);

int cmd_to(const std::vector<std::string>&args);
int cmd_from(const std::vector<std::string>&args);
int cmd_conv(const std::vector<std::string>&args);
int cmd_dow(const std::vector<std::string>&args);
int cmd_test(const std::vector<std::string>&args);
int cmd_cfg(const std::vector<std::string>&args);
int cmd_comp(const std::vector<std::string>&args);

std::string tool_ver();

std::vector<CalKind> parse_cals(const std::string&arg);

void use_main();
void use_to();
void use_from();
void use_conv();
void use_dow();
void use_test();
void use_cfg();
void use_comp();
