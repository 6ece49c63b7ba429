#include "cjdn/c_api.h"

#include<cstring>
#include<exception>
#include<stdexcept>
#include<string>
#include<tuple>
#include<vector>

#include "cjdn/calendar.hpp"
#include "cjdn/cli.hpp"
#include "cjdn/entry.hpp"
#include "cjdn/format.hpp"

namespace{

thread_local std::string g_last_error;

void set_err(const std::string&msg){
	g_last_error=msg;
}

void clr_err(){
	g_last_error.clear();
}

std::vector<std::string> mk_args(int argc,const char*const*argv){
	if(argc<0){
		throw std::invalid_argument("argc must be >= 0");
	}
	if(argc>0&&argv==nullptr){
		throw std::invalid_argument("argv must not be null when argc > 0");
	}

	std::vector<std::string> out;
	out.reserve(static_cast<std::size_t>(argc));
	for(int i=0;i<argc;++i){
		if(argv[i]==nullptr){
			throw std::invalid_argument("argv contains null entry");
		}
		out.emplace_back(argv[i]);
	}
	return out;
}

template<typename T>
void chk_ptr(const T*p,const char*name){
	if(p==nullptr){
		throw std::invalid_argument(std::string(name)+" must not be null");
	}
}

int map_ex(const std::invalid_argument&ex){
	set_err(ex.what());
	return CJDN_ERR_ARG;
}

int map_ex(const std::exception&ex){
	set_err(ex.what());
	return CJDN_ERR_FAIL;
}

int map_ukn_ex(){
	set_err("unknown error");
	return CJDN_ERR_FAIL;
}

template<typename Fn>
int guard(Fn&&fn){
	clr_err();
	try{
		return fn();
	}catch(const std::invalid_argument&ex){
		return map_ex(ex);
	}catch(const std::exception&ex){
		return map_ex(ex);
	}catch(...){
		return map_ukn_ex();
	}
}

using CmdFn=int(*)(const std::vector<std::string>&args);

int run_cmd(CmdFn cmd,int argc,const char*const*argv){
	std::vector<std::string> args=mk_args(argc,argv);
	return cmd(args);
}

}

extern "C"{

const char*CJDN_CALL cjdn_tool_ver(void){
	static thread_local std::string ver;
	ver=tool_ver();
	return ver.c_str();
}

const char*CJDN_CALL cjdn_last_error(void){
	return g_last_error.empty()?nullptr:g_last_error.c_str();
}

void CJDN_CALL cjdn_clear_error(void){
	clr_err();
}

int CJDN_CALL cjdn_run(int argc,const char*const*argv){
	return guard([&](){
		std::vector<std::string> args=mk_args(argc,argv);
		return run_cli_args(args);
	});
}

int CJDN_CALL cjdn_cmd_to(int argc,const char*const*argv){
	return guard([&](){ return run_cmd(cmd_to,argc,argv); });
}

int CJDN_CALL cjdn_cmd_from(int argc,const char*const*argv){
	return guard([&](){ return run_cmd(cmd_from,argc,argv); });
}

int CJDN_CALL cjdn_cmd_conv(int argc,const char*const*argv){
	return guard([&](){ return run_cmd(cmd_conv,argc,argv); });
}

int CJDN_CALL cjdn_cmd_dow(int argc,const char*const*argv){
	return guard([&](){ return run_cmd(cmd_dow,argc,argv); });
}

int CJDN_CALL cjdn_cmd_test(int argc,const char*const*argv){
	return guard([&](){ return run_cmd(cmd_test,argc,argv); });
}

int CJDN_CALL cjdn_cmd_cfg(int argc,const char*const*argv){
	return guard([&](){ return run_cmd(cmd_cfg,argc,argv); });
}

int CJDN_CALL cjdn_cmd_comp(int argc,const char*const*argv){
	return guard([&](){ return run_cmd(cmd_comp,argc,argv); });
}

int CJDN_CALL cjdn_from_date(int kind,long long year,int month,int day,
							 long long*out){
	return guard([&](){
		chk_ptr(out,"out");
		*out=cal2cj(cal_from_int(kind),year,month,day);
		return CJDN_OK;
	});
}

int CJDN_CALL cjdn_from_text(int kind,const char*date,long long*out){
	return guard([&](){
		chk_ptr(date,"date");
		chk_ptr(out,"out");
		CalKind k=cal_from_int(kind);
		auto ymd=parse_ymd(date);
		*out=cal2cj(k,std::get<0>(ymd),std::get<1>(ymd),std::get<2>(ymd));
		return CJDN_OK;
	});
}

int CJDN_CALL cjdn_to_date(int kind,long long cjdn,long long*year,
						   int*month,int*day){
	return guard([&](){
		chk_ptr(year,"year");
		chk_ptr(month,"month");
		chk_ptr(day,"day");
		CalDate d=cj2cal(cjdn,cal_from_int(kind));
		*year=d.year;
		*month=d.month;
		*day=d.day;
		return CJDN_OK;
	});
}

int CJDN_CALL cjdn_fmt_date(int kind,long long cjdn,char*buf,size_t size){
	return guard([&](){
		chk_ptr(buf,"buf");
		std::string text=cj2iso(cjdn,cal_from_int(kind));
		if(text.size()+1>size){
			throw std::invalid_argument("buffer too small: need "+
										std::to_string(text.size()+1)+
										" bytes");
		}
		std::memcpy(buf,text.c_str(),text.size()+1);
		return CJDN_OK;
	});
}

int CJDN_CALL cjdn_weekday(long long cjdn,int kind,int*out){
	return guard([&](){
		chk_ptr(out,"out");
		*out=day_of_week(cjdn,cal_from_int(kind));
		return CJDN_OK;
	});
}

}
