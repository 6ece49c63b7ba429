#include "cjdn/interact.hpp"

#include<cctype>
#include<cstdlib>
#include<exception>
#include<fstream>
#include<iostream>
#include<set>
#include<stdexcept>
#include<vector>

#include "cjdn/calendar.hpp"
#include "cjdn/cli.hpp"

std::string cfg_path(){
	const char*env=std::getenv("CJDN_CONFIG");
	if(env!=nullptr&&*env!='\0'){
		return env;
	}
	return "cjdn_cfg.txt";
}

std::string trim(const std::string&s){
	std::size_t start=0;
	while(start<s.size()&&std::isspace(static_cast<unsigned char>(s[start]))){
		++start;
	}
	std::size_t end=s.size();
	while(end>start&&std::isspace(static_cast<unsigned char>(s[end-1]))){
		--end;
	}
	return s.substr(start,end-start);
}

bool load_cfg(InterCfg&cfg){
	std::ifstream ifs(cfg_path());
	if(!ifs){
		return false;
	}
	std::string line;
	while(std::getline(ifs,line)){
		auto pos=line.find('=');
		if(pos==std::string::npos){
			continue;
		}
		std::string key=trim(line.substr(0,pos));
		std::string value=trim(line.substr(pos+1));
		if(key=="def_cal"){
			cfg.def_cal=value;
		}else if(key=="def_fmt"){
			cfg.def_fmt=value;
		}else if(key=="def_prety"){
			cfg.def_prety=(value=="1"||value=="true"||value=="yes");
		}else if(key=="strict"){
			cfg.strict=(value=="1"||value=="true"||value=="yes");
		}
	}
	return true;
}

bool save_cfg(const InterCfg&cfg){
	std::ofstream ofs(cfg_path());
	if(!ofs){
		return false;
	}
	ofs<<"def_cal="<<cfg.def_cal<<"\n";
	ofs<<"def_fmt="<<cfg.def_fmt<<"\n";
	ofs<<"def_prety="<<(cfg.def_prety?"1":"0")<<"\n";
	ofs<<"strict="<<(cfg.strict?"1":"0")<<"\n";
	return static_cast<bool>(ofs);
}

InterCfg load_def(){
	InterCfg cfg;
	load_cfg(cfg);
	try{
		cfg.def_cal=cal_name(parse_cal(cfg.def_cal));
	}catch(const std::invalid_argument&){
		cfg.def_cal="gregorian";
	}
	static const std::set<std::string> kFmts={"txt","json","csv","jsonl"};
	if(kFmts.find(cfg.def_fmt)==kFmts.end()){
		cfg.def_fmt="txt";
	}
	return cfg;
}

std::string ask_line(const std::string&msg){
	std::cout<<msg;
	std::string line;
	if(!std::getline(std::cin,line)){
		return "";
	}
	return trim(line);
}

namespace{

std::string ask_cal(){
	std::string cal=ask_line(
		"Calendar: 1) julian  2) milankovic  3) gregorian (default 3): ");
	return cal.empty()?"gregorian":cal;
}

void ask_fmt(std::vector<std::string>&args){
	std::string fmt=ask_line("Output format: 1) txt  2) json (default txt): ");
	if(fmt=="2"||fmt=="json"){
		args.push_back("--format");
		args.push_back("json");
	}
}

void run_step(const char*name,void(*fn)()){
	try{
		fn();
	}catch(const std::exception&ex){
		std::cout<<"error in "<<name<<": "<<ex.what()<<std::endl;
	}
	ask_line("Press Enter to return to the menu.");
}

}

void int_to(){
	std::vector<std::string> args={ask_cal()};
	std::string date=ask_line("Date [-]YYYY-MM-DD: ");
	if(date.empty()){
		throw std::invalid_argument("date must not be empty");
	}
	args.push_back(date);
	std::string strict=ask_line("Reject impossible dates? (y/N): ");
	if(!strict.empty()&&(strict[0]=='y'||strict[0]=='Y')){
		args.push_back("--strict");
		args.push_back("1");
	}
	ask_fmt(args);
	cmd_to(args);
}

void int_from(){
	std::vector<std::string> args={ask_cal()};
	std::string num=ask_line("CJDN: ");
	if(num.empty()){
		throw std::invalid_argument("CJDN must not be empty");
	}
	args.push_back(num);
	std::string part=
		ask_line("Return: 1) full date  2) year  3) month  4) day (default 1): ");
	if(part=="2"){
		args.push_back("--year");
	}else if(part=="3"){
		args.push_back("--month");
	}else if(part=="4"){
		args.push_back("--day");
	}
	ask_fmt(args);
	cmd_from(args);
}

void int_conv(){
	std::vector<std::string> args={ask_cal()};
	std::string date=ask_line("Date [-]YYYY-MM-DD: ");
	if(date.empty()){
		throw std::invalid_argument("date must not be empty");
	}
	args.push_back(date);
	ask_fmt(args);
	cmd_conv(args);
}

void int_dow(){
	std::string num=ask_line("CJDN: ");
	if(num.empty()){
		throw std::invalid_argument("CJDN must not be empty");
	}
	std::vector<std::string> args={num};
	ask_fmt(args);
	cmd_dow(args);
}

void int_mode(){
	while(true){
		std::cout<<"\nChoose an action:\n";
		std::cout<<"[1] calendar date -> CJDN (to)\n";
		std::cout<<"[2] CJDN -> calendar date (from)\n";
		std::cout<<"[3] date in all calendars (convert)\n";
		std::cout<<"[4] day of week (dow)\n";
		std::cout<<"[5] selftest\n";
		std::cout<<"[h] command line help\n";
		std::cout<<"[q] quit\n";
		std::string choice=ask_line("Option: ");
		if(!std::cin){
			break;
		}
		if(choice=="1"){
			run_step("to",int_to);
		}else if(choice=="2"){
			run_step("from",int_from);
		}else if(choice=="3"){
			run_step("convert",int_conv);
		}else if(choice=="4"){
			run_step("dow",int_dow);
		}else if(choice=="5"){
			run_step("selftest",[](){ cmd_test({}); });
		}else if(choice=="h"||choice=="H"){
			use_main();
			ask_line("Press Enter to return to the menu.");
		}else if(choice=="q"||choice=="Q"){
			break;
		}else{
			std::cout<<"Unknown option, try again."<<std::endl;
		}
	}
}
