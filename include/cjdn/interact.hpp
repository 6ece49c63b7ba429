#pragma once

#include<string>

struct InterCfg{
	std::string def_cal="gregorian";
	std::string def_fmt="txt";
	bool def_prety=true;
	bool strict=false;
};

// cjdn_cfg.txt in the working directory unless CJDN_CONFIG names a file.
std::string cfg_path();

std::string trim(const std::string&s);

bool load_cfg(InterCfg&cfg);

bool save_cfg(const InterCfg&cfg);

// load_cfg with unusable values replaced by the defaults.
InterCfg load_def();

std::string ask_line(const std::string&msg);

void int_to();

void int_from();

void int_conv();

void int_dow();

void int_mode();
