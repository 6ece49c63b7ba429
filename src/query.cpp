#include "cjdn/cli.hpp"
#include "cjdn/cli_common.hpp"

#include<cmath>
#include<functional>
#include<iostream>
#include<sstream>
#include<stdexcept>
#include<string>
#include<vector>

#include "cjdn/calendar.hpp"
#include "cjdn/format.hpp"
#include "cjdn/interact.hpp"
#include "cjdn/js_writer.hpp"

#include "erfa.h"

namespace{

using cli_util::OutTgt;
using cli_util::chk_fmt;
using cli_util::is_help;
using cli_util::note_out;
using cli_util::open_out;
using cli_util::parse_bool01;
using cli_util::req_val;
using cli_util::to_low;

constexpr long long RT_FIRST=-100000;
constexpr long long RT_LAST=2817151;

// Gregorian -4799-01-01, the first year eraCal2jd accepts.
constexpr long long ERFA_FIRST=-31738;
constexpr long long ERFA_STEP=97;

struct Case{
	std::string id;
	bool pass=false;
	std::string message;
};

Case run_case(const std::string&id,const std::function<std::string()>&fn){
	Case c;
	c.id=id;
	try{
		c.message=fn();
		c.pass=c.message.empty();
		if(c.pass){
			c.message="ok";
		}
	}catch(const std::exception&ex){
		c.pass=false;
		c.message=ex.what();
	}
	return c;
}

std::string expect(bool ok,const std::string&what){ return ok?"":what; }

std::string chk_fixed(){
	if(jul2cj(-4712,1,1)!=0||cj2iso(0,CalKind::julian)!="-4712-01-01"){
		return "CJDN 0 is not julian -4712-01-01";
	}
	if(greg2cj(2000,1,1)!=2451545||cj2iso(2451545,CalKind::gregorian)!=
										   "2000-01-01"){
		return "gregorian 2000-01-01 is not CJDN 2451545";
	}
	if(greg2cj(1900,2,29)!=greg2cj(1900,3,1)){
		return "gregorian 1900-02-29 does not roll over to 1900-03-01";
	}
	return expect(cj2iso(-100000,CalKind::gregorian)=="-4986-02-09"&&
					  cj2iso(-100000,CalKind::julian)=="-4986-03-20",
				  "pre-epoch dates use truncating division");
}

std::string chk_milk(){
	if(is_leap(CalKind::milankovic,2800)||!is_leap(CalKind::milankovic,2900)){
		return "milankovic 900-year rule broken";
	}
	return expect(cj2iso(greg2cj(2800,2,29),CalKind::milankovic)==
					  "2800-03-01",
				  "gregorian 2800-02-29 is not milankovic 2800-03-01");
}

// One pass over the range feeds both the round-trip and weekday cases.
struct RangeStat{
	long long checked=0;
	long long rt_bad=0;
	long long dow_bad=0;
	std::string first_rt;
	std::string first_dow;
};

RangeStat scan_range(){
	const CalKind kinds[]={CalKind::julian,CalKind::milankovic,
						   CalKind::gregorian};
	RangeStat st;
	for(long long cj=RT_FIRST;cj<=RT_LAST;++cj){
		int dow=day_of_week(cj);
		for(CalKind k : kinds){
			CalDate d=cj2cal(cj,k);
			++st.checked;
			if(cal2cj(k,d)!=cj){
				if(st.rt_bad++==0){
					st.first_rt=std::string(cal_name(k))+" "+std::to_string(cj);
				}
			}
			if(dow_cong(k,d)!=dow){
				if(st.dow_bad++==0){
					st.first_dow=std::string(cal_name(k))+" "+std::to_string(cj);
				}
			}
		}
	}
	return st;
}

std::string chk_erfa(){
	long long checked=0;
	for(long long cj=ERFA_FIRST;cj<=RT_LAST;cj+=ERFA_STEP){
		CalDate d=cj_greg(cj);

		int iy=0,im=0,id=0;
		double fd=0.0;
		if(eraJd2cal(static_cast<double>(cj)-0.5,0.0,&iy,&im,&id,&fd)!=0){
			return "eraJd2cal rejected CJDN "+std::to_string(cj);
		}
		if(iy!=d.year||im!=d.month||id!=d.day){
			return "eraJd2cal disagrees at CJDN "+std::to_string(cj)+": "+
				   fmt_ymd(iy,im,id)+" vs "+fmt_ymd(d.year,d.month,d.day);
		}

		double djm0=0.0;
		double djm=0.0;
		if(eraCal2jd(iy,im,id,&djm0,&djm)!=0){
			return "eraCal2jd rejected "+fmt_ymd(iy,im,id);
		}
		long long ref=std::llround(djm0+djm+0.5);
		if(ref!=greg2cj(d.year,d.month,d.day)){
			return "eraCal2jd disagrees at "+fmt_ymd(iy,im,id);
		}
		++checked;
	}
	return expect(checked>0,"no dates checked");
}

}

int cmd_test(const std::vector<std::string>&args){
	if(is_help(args)){
		use_test();
		return 0;
	}
	std::string format="txt";
	std::string out_path;
	bool pretty=true;
	bool quiet=false;
	for(std::size_t i=0;i<args.size();++i){
		const std::string&opt=args[i];
		if(opt=="--format"){
			format=to_low(req_val(args,i,opt));
		}else if(opt=="--out"){
			out_path=req_val(args,i,opt);
		}else if(opt=="--pretty"){
			pretty=parse_bool01(req_val(args,i,opt),"--pretty");
		}else if(opt=="--quiet"){
			quiet=true;
		}else{
			throw std::invalid_argument("unknown option for selftest: "+opt);
		}
	}
	chk_fmt(format,{"json","txt"},"selftest");

	std::vector<Case> cases;
	cases.push_back(run_case("fixed_pts",chk_fixed));
	cases.push_back(run_case("milk_900",chk_milk));

	if(!quiet){
		std::cerr<<"scanning CJDN "<<RT_FIRST<<" .. "<<RT_LAST<<" ..."
				 <<std::endl;
	}
	RangeStat st=scan_range();
	cases.push_back(run_case("round_trip",[&st](){
		std::ostringstream msg;
		if(st.rt_bad!=0){
			msg<<"mismatches="<<st.rt_bad<<" first="<<st.first_rt;
		}
		return msg.str();
	}));
	cases.push_back(run_case("dow_cong",[&st](){
		std::ostringstream msg;
		if(st.dow_bad!=0){
			msg<<"mismatches="<<st.dow_bad<<" first="<<st.first_dow;
		}
		return msg.str();
	}));
	cases.push_back(run_case("erfa_greg",chk_erfa));

	bool all_pass=true;
	for(const auto&c : cases){
		all_pass=all_pass&&c.pass;
	}

	OutTgt out=open_out(out_path);
	if(format=="json"){
		JsonWriter w(*out.stream,pretty);
		w.obj_begin();
		w.key("meta");
		w.obj_begin();
		w.field("tool","cjdn");
		w.field("version",tool_ver());
		w.field("schema","cjdn.v1");
		w.field("type","selftest");
		w.obj_end();
		w.key("data");
		w.obj_begin();
		w.field("pass",all_pass);
		w.field("checked",st.checked);
		w.key("cases");
		w.arr_begin();
		for(const auto&c : cases){
			w.obj_begin();
			w.field("id",c.id);
			w.field("pass",c.pass);
			w.field("message",c.message);
			w.obj_end();
		}
		w.arr_end();
		w.obj_end();
		w.obj_end();
		w.finish();
	}else{
		std::ostream&os=*out.stream;
		os<<"tool=cjdn format=txt type=selftest\n";
		os<<"result.pass="<<(all_pass?"1":"0")<<"\n";
		os<<"result.checked="<<st.checked<<"\n";
		os<<"id\tpass\tmessage\n";
		for(const auto&c : cases){
			os<<c.id<<"\t"<<(c.pass?"1":"0")<<"\t"<<c.message<<"\n";
		}
	}
	note_out(out_path,quiet);
	return all_pass?0:1;
}

int cmd_cfg(const std::vector<std::string>&args){
	if(args.empty()||is_help(args)){
		use_cfg();
		return 0;
	}
	std::string action=to_low(args[0]);
	std::string format="txt";
	std::string out_path;
	bool pretty=true;
	bool quiet=false;

	auto parse_opt=[&](std::size_t start){
		for(std::size_t i=start;i<args.size();++i){
			const std::string&opt=args[i];
			if(opt=="--format"){
				format=to_low(req_val(args,i,opt));
			}else if(opt=="--out"){
				out_path=req_val(args,i,opt);
			}else if(opt=="--pretty"){
				pretty=parse_bool01(req_val(args,i,opt),"--pretty");
			}else if(opt=="--quiet"){
				quiet=true;
			}else{
				throw std::invalid_argument("unknown option for config: "+opt);
			}
		}
	};

	InterCfg cfg=load_def();
	if(action=="show"){
		parse_opt(1);
		chk_fmt(format,{"json","txt"},"config show");
		OutTgt out=open_out(out_path);
		if(format=="json"){
			JsonWriter w(*out.stream,pretty);
			w.obj_begin();
			w.key("meta");
			w.obj_begin();
			w.field("tool","cjdn");
			w.field("schema","cjdn.v1");
			w.field("path",cfg_path());
			w.obj_end();
			w.key("data");
			w.obj_begin();
			w.field("def_cal",cfg.def_cal);
			w.field("def_fmt",cfg.def_fmt);
			w.field("def_prety",cfg.def_prety);
			w.field("strict",cfg.strict);
			w.obj_end();
			w.obj_end();
			w.finish();
		}else{
			*out.stream<<"tool=cjdn format=txt type=config\n";
			*out.stream<<"def_cal="<<cfg.def_cal<<"\n";
			*out.stream<<"def_fmt="<<cfg.def_fmt<<"\n";
			*out.stream<<"def_prety="<<(cfg.def_prety?"1":"0")<<"\n";
			*out.stream<<"strict="<<(cfg.strict?"1":"0")<<"\n";
		}
		note_out(out_path,quiet);
		return 0;
	}

	if(action=="set"){
		if(args.size()<3){
			throw std::invalid_argument("config set requires: <key> <value>");
		}
		std::string key=to_low(args[1]);
		std::string value=args[2];
		parse_opt(3);
		if(key=="def_cal"){
			cfg.def_cal=cal_name(parse_cal(value));
		}else if(key=="def_fmt"){
			std::string v=to_low(value);
			chk_fmt(v,{"txt","json","csv","jsonl"},"config def_fmt");
			cfg.def_fmt=v;
		}else if(key=="def_prety"){
			cfg.def_prety=parse_bool01(value,"def_prety");
		}else if(key=="strict"){
			cfg.strict=parse_bool01(value,"strict");
		}else{
			throw std::invalid_argument("unknown config key: "+key);
		}
		if(!save_cfg(cfg)){
			throw std::runtime_error("failed to save config: "+cfg_path());
		}
		if(!quiet){
			std::cerr<<"written: "<<cfg_path()<<"\n";
		}
		return 0;
	}

	throw std::invalid_argument("config action must be show or set");
}

int cmd_comp(const std::vector<std::string>&args){
	if(args.empty()||is_help(args)){
		use_comp();
		return 0;
	}
	std::string shell=to_low(args[0]);
	if(shell=="bash"||shell=="zsh"){
		std::cout<<"_cjdn_complete() {\n"
				 <<"  local cur\n"
				 <<"  COMPREPLY=()\n"
				 <<"  cur=\"${COMP_WORDS[COMP_CWORD]}\"\n"
				 <<"  local cmds=\"to from convert dow selftest config "
				   "completion\"\n"
				 <<"  if [[ ${COMP_CWORD} -eq 1 ]]; then\n"
				 <<"    COMPREPLY=( $(compgen -W \"${cmds}\" -- \"${cur}\") )\n"
				 <<"    return 0\n"
				 <<"  fi\n"
				 <<"  local opts=\"--help --format --out --pretty --quiet "
				   "--strict --stdin --file --year --month --day --to "
				   "gregorian milankovic julian\"\n"
				 <<"  COMPREPLY=( $(compgen -W \"${opts}\" -- \"${cur}\") )\n"
				 <<"}\n"
				 <<"complete -F _cjdn_complete cjdn\n";
		return 0;
	}
	if(shell=="fish"){
		std::cout<<"complete -c cjdn -f\n"
				 <<"complete -c cjdn -n '__fish_use_subcommand' -a 'to from "
				   "convert dow selftest config completion'\n"
				 <<"complete -c cjdn -n 'not __fish_use_subcommand' -a "
				   "'gregorian milankovic julian'\n";
		return 0;
	}
	if(shell=="powershell"){
		std::cout
			<<"Register-ArgumentCompleter -Native -CommandName cjdn "
			  "-ScriptBlock {\n"
			<<"  param($wordToComplete, $commandAst, $cursorPosition)\n"
			<<"  $cmds = "
			  "'to','from','convert','dow','selftest','config','completion'\n"
			<<"  $cmds | Where-Object { $_ -like \"$wordToComplete*\" } | "
			  "ForEach-Object {\n"
			<<"    "
			  "[System.Management.Automation.CompletionResult]::new($_,$_,'"
			  "ParameterValue',$_)\n"
			<<"  }\n"
			<<"}\n";
		return 0;
	}
	throw std::invalid_argument(
		"completion shell must be bash|zsh|fish|powershell");
}

void use_test(){
	std::cout<<"Usage:\n"
			 <<"  cjdn selftest [--format json|txt] [--out ...] [--pretty 0|1] "
			   "[--quiet]\n"
			 <<"Checks:\n"
			 <<"  fixed points, milankovic 900-year rule, round trips and "
			   "weekday\n"
			 <<"  congruences over CJDN -100000..2817151, gregorian against "
			   "ERFA\n"
			 <<"Examples:\n"
			 <<"  cjdn selftest\n"
			 <<"  cjdn selftest --format json --out selftest.json\n";
}

void use_cfg(){
	std::cout<<"Usage:\n"
			 <<"  cjdn config show [--format json|txt] [--out ...] [--pretty "
			   "0|1] [--quiet]\n"
			 <<"  cjdn config set <key> <value>\n"
			 <<"Keys:\n"
			 <<"  def_cal | def_fmt | def_prety | strict\n"
			 <<"File:\n"
			 <<"  cjdn_cfg.txt in the working directory, or $CJDN_CONFIG\n"
			 <<"Examples:\n"
			 <<"  cjdn config show\n"
			 <<"  cjdn config set def_cal julian\n";
}

void use_comp(){
	std::cout<<"Usage:\n"
			 <<"  cjdn completion bash|zsh|fish|powershell\n"
			 <<"Examples:\n"
			 <<"  cjdn completion bash > cjdn-completion.bash\n"
			 <<"  cjdn completion powershell > cjdn-completion.ps1\n";
}
