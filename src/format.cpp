#include "cjdn/format.hpp"

#include<cctype>
#include<iomanip>
#include<sstream>

namespace{

bool is_digit(char c){ return std::isdigit(static_cast<unsigned char>(c))!=0; }

bool is_space(char c){ return std::isspace(static_cast<unsigned char>(c))!=0; }

int parse_fix(const std::string&s,std::size_t pos,std::size_t count,
			  const std::string&label){
	if(pos+count>s.size()){
		throw ParseError("invalid date: missing "+label+": "+s);
	}
	int value=0;
	for(std::size_t i=0;i<count;++i){
		char c=s[pos+i];
		if(!is_digit(c)){
			throw ParseError("invalid date: bad "+label+": "+s);
		}
		value=value*10+static_cast<int>(c-'0');
	}
	return value;
}

}

long long parse_num(const std::string&text,const std::string&label){
	std::size_t start=0;
	std::size_t end=text.size();
	while(start<end&&is_space(text[start])){
		++start;
	}
	while(end>start&&is_space(text[end-1])){
		--end;
	}
	std::string body=text.substr(start,end-start);

	std::size_t pos=0;
	if(pos<body.size()&&(body[pos]=='+'||body[pos]=='-')){
		++pos;
	}
	if(pos==body.size()){
		throw ParseError("invalid "+label+": "+text);
	}
	for(std::size_t i=pos;i<body.size();++i){
		if(!is_digit(body[i])){
			throw ParseError("invalid "+label+": "+text);
		}
	}

	try{
		return std::stoll(body);
	}catch(const std::out_of_range&){
		throw ParseError(label+" out of range: "+text);
	}
}

std::string fmt_year(long long year){
	unsigned long long mag=year<0?0ULL-static_cast<unsigned long long>(year)
								 :static_cast<unsigned long long>(year);
	std::ostringstream oss;
	if(year<0){
		oss<<'-';
	}
	oss<<std::setfill('0')<<std::setw(4)<<mag;
	return oss.str();
}

std::string fmt_ymd(long long year,int month,int day){
	std::ostringstream oss;
	oss<<fmt_year(year)<<"-"<<std::setfill('0')<<std::setw(2)<<month<<"-"
	   <<std::setw(2)<<day;
	return oss.str();
}

std::tuple<long long,int,int> parse_ymd(const std::string&s){
	if(s.empty()){
		throw ParseError("date text is empty");
	}

	std::size_t pos=0;
	if(s[0]=='-'||s[0]=='+'){
		++pos;
	}
	std::size_t digits=pos;
	while(digits<s.size()&&is_digit(s[digits])){
		++digits;
	}
	if(digits-pos<4){
		throw ParseError("invalid date, expected [-]YYYY-MM-DD: "+s);
	}
	if(s.size()!=digits+6||s[digits]!='-'||s[digits+3]!='-'){
		throw ParseError("invalid date, expected [-]YYYY-MM-DD: "+s);
	}

	long long y=parse_num(s.substr(0,digits),"year");
	int m=parse_fix(s,digits+1,2,"month");
	int d=parse_fix(s,digits+4,2,"day");
	return {y,m,d};
}

const char*dow_name(int dow){
	static const char*const kNames[7]={"Monday","Tuesday","Wednesday",
										 "Thursday","Friday","Saturday",
										 "Sunday"};
	if(dow<1||dow>7){
		throw std::out_of_range("weekday out of range: "+std::to_string(dow));
	}
	return kNames[dow-1];
}
