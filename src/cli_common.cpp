#include "cjdn/cli_common.hpp"

#include<cctype>
#include<iostream>
#include<stdexcept>

namespace cli_util{

bool is_opt(const std::string&s){
	// "-12" is a negative CJDN or year, not an option.
	return s.size()>1&&s[0]=='-'&&!std::isdigit(static_cast<unsigned char>(s[1]));
}

bool is_help(const std::vector<std::string>&args){
	return args.size()==1&&(args[0]=="-h"||args[0]=="--help");
}

std::string to_low(std::string s){
	for(char&c : s){
		c=static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	return s;
}

bool parse_bool01(const std::string&text,const std::string&label){
	if(text=="0"){
		return false;
	}
	if(text=="1"){
		return true;
	}
	throw std::invalid_argument(label+" must be 0 or 1");
}

std::string req_val(const std::vector<std::string>&args,std::size_t&idx,
					const std::string&opt){
	if(idx+1>=args.size()){
		throw std::invalid_argument("missing value for option: "+opt);
	}
	++idx;
	return args[idx];
}

OutTgt open_out(const std::string&path){
	OutTgt out;
	if(path.empty()){
		out.stream=&std::cout;
		return out;
	}
	out.file.open(path,std::ios::binary);
	if(!out.file){
		throw std::runtime_error("failed to open output file: "+path);
	}
	out.stream=&out.file;
	return out;
}

void note_out(const std::string&path,bool quiet){
	if(!path.empty()&&!quiet){
		std::cerr<<"written: "<<path<<std::endl;
	}
}

void chk_fmt(const std::string&format,const std::set<std::string>&allowed,
			 const std::string&ctx){
	if(allowed.find(format)==allowed.end()){
		throw std::invalid_argument("invalid --format for "+ctx+": "+format);
	}
}

std::string csv_quote(const std::string&s){
	if(s.find_first_of(",\"\r\n")==std::string::npos){
		return s;
	}
	std::string out="\"";
	for(char c : s){
		if(c=='"'){
			out+="\"\"";
		}else{
			out.push_back(c);
		}
	}
	out.push_back('"');
	return out;
}

std::vector<BatchLine> read_bat(bool from_stdin,const std::string&input_file){
	std::vector<BatchLine> lines;
	if(from_stdin&&!input_file.empty()){
		throw std::invalid_argument("--stdin and --file cannot be used together");
	}
	if(!from_stdin&&input_file.empty()){
		return lines;
	}
	std::istream*in=nullptr;
	std::ifstream ifs;
	if(from_stdin){
		in=&std::cin;
	}else{
		ifs.open(input_file,std::ios::binary);
		if(!ifs){
			throw std::runtime_error("failed to open input file: "+input_file);
		}
		in=&ifs;
	}
	std::string raw;
	int line_no=0;
	while(std::getline(*in,raw)){
		++line_no;
		while(!raw.empty()&&(raw.back()=='\r'||raw.back()=='\n'||
							 raw.back()==' '||raw.back()=='\t')){
			raw.pop_back();
		}
		if(raw.empty()||raw[0]=='#'){
			continue;
		}
		lines.push_back({line_no,raw});
	}
	return lines;
}

} // namespace cli_util
