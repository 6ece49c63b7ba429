#include "cjdn/cli.hpp"
#include "cjdn/cli_common.hpp"

#include<functional>
#include<iostream>
#include<set>
#include<sstream>
#include<stdexcept>
#include<tuple>
#include<unordered_map>
#include<utility>

#include "cjdn/format.hpp"
#include "cjdn/interact.hpp"
#include "cjdn/js_writer.hpp"

namespace{

using cli_util::BatchLine;
using cli_util::OutTgt;
using cli_util::chk_fmt;
using cli_util::csv_quote;
using cli_util::is_help;
using cli_util::is_opt;
using cli_util::note_out;
using cli_util::open_out;
using cli_util::parse_bool01;
using cli_util::read_bat;
using cli_util::req_val;
using cli_util::to_low;

using OptHandler=
	std::function<void(const std::vector<std::string>&,std::size_t&,
					   const std::string&)>;
using OptMap=std::unordered_map<std::string,OptHandler>;

void apply_opt(const OptMap&handlers,const std::vector<std::string>&args,
			   std::size_t&idx,const std::string&opt,const std::string&ctx){
	auto it=handlers.find(opt);
	if(it==handlers.end()){
		throw std::invalid_argument("unknown option for "+ctx+": "+opt);
	}
	it->second(args,idx,opt);
}

// Options go through handlers, everything else is returned in order.
std::vector<std::string> split_args(const OptMap&handlers,
									const std::vector<std::string>&args,
									const std::string&ctx){
	std::vector<std::string> pos;
	for(std::size_t i=0;i<args.size();++i){
		const std::string&a=args[i];
		if(is_opt(a)){
			apply_opt(handlers,args,i,a,ctx);
		}else{
			pos.push_back(a);
		}
	}
	return pos;
}

void add_out(OptMap&handlers,std::string&format,std::string&out,bool&pretty,
			 bool&quiet){
	handlers["--format"]=[&format](const std::vector<std::string>&src,
								   std::size_t&idx,const std::string&opt){
		format=to_low(req_val(src,idx,opt));
	};
	handlers["--out"]=[&out](const std::vector<std::string>&src,
							 std::size_t&idx,
							 const std::string&opt){ out=req_val(src,idx,opt); };
	handlers["--pretty"]=[&pretty](const std::vector<std::string>&src,
								   std::size_t&idx,const std::string&opt){
		pretty=parse_bool01(req_val(src,idx,opt),"--pretty");
	};
	handlers["--quiet"]=[&quiet](const std::vector<std::string>&,
								 std::size_t&,
								 const std::string&){ quiet=true; };
}

void add_batch(OptMap&handlers,bool&from_stdin,std::string&input_file){
	handlers["--stdin"]=[&from_stdin](const std::vector<std::string>&,
									  std::size_t&,
									  const std::string&){ from_stdin=true; };
	handlers["--file"]=[&input_file](const std::vector<std::string>&src,
									 std::size_t&idx,const std::string&opt){
		input_file=req_val(src,idx,opt);
	};
}

std::string pick_fmt(const InterCfg&cfg,const std::set<std::string>&allowed){
	std::string format=to_low(cfg.def_fmt);
	if(allowed.find(format)==allowed.end()){
		return "txt";
	}
	return format;
}

void write_meta(JsonWriter&w,const std::string&type,CalKind cal){
	w.key("meta");
	w.obj_begin();
	w.field("tool","cjdn");
	w.field("version",tool_ver());
	w.field("schema","cjdn.v1");
	w.field("type",type);
	w.field("calendar",cal_name(cal));
	w.obj_end();
}

const char*part_key(DatePart part){
	switch(part){
	case DatePart::year:
		return "year";
	case DatePart::month:
		return "month";
	case DatePart::day:
		return "day";
	case DatePart::full:
		break;
	}
	return "date";
}

// "-4712" is a day number, "-4712-01-01" a date.
bool is_int(const std::string&s){
	std::size_t pos=(!s.empty()&&(s[0]=='-'||s[0]=='+'))?1:0;
	if(pos==s.size()){
		return false;
	}
	for(;pos<s.size();++pos){
		if(s[pos]<'0'||s[pos]>'9'){
			return false;
		}
	}
	return true;
}

std::string out_text(const CjOut&r){
	return r.is_text()?r.iso:std::to_string(r.value);
}

struct DateIn{
	std::string raw;
	long long year=0;
	long long month=0;
	long long day=0;
};

DateIn date_line(const std::string&raw){
	DateIn in;
	in.raw=raw;
	std::istringstream iss(raw);
	std::vector<std::string> parts;
	std::string tok;
	while(iss>>tok){
		parts.push_back(tok);
	}
	if(parts.size()==1){
		std::tie(in.year,in.month,in.day)=parse_ymd(parts[0]);
	}else if(parts.size()==3){
		in.year=parse_num(parts[0],"year");
		in.month=parse_num(parts[1],"month");
		in.day=parse_num(parts[2],"day");
	}else{
		throw std::invalid_argument(
			"expected [-]YYYY-MM-DD or <year> <month> <day>: "+raw);
	}
	return in;
}

DateIn date_in(const ToArgs&args){
	if(!args.date_text.empty()){
		return date_line(args.date_text);
	}
	DateIn in;
	in.raw=args.year+" "+args.month+" "+args.day;
	in.year=parse_num(args.year,"year");
	in.month=parse_num(args.month,"month");
	in.day=parse_num(args.day,"day");
	return in;
}

long long to_cj(CalKind cal,const DateIn&in,bool strict){
	if(strict){
		return cal2cj_strict(cal,in.year,in.month,in.day);
	}
	return cal2cj(cal,in.year,in.month,in.day);
}

void note_norm(CalKind cal,const DateIn&in,long long cjdn,bool quiet){
	if(quiet||valid_date(cal,in.year,in.month,in.day)){
		return;
	}
	std::cerr<<"note: "<<in.raw<<" is not a valid "<<cal_name(cal)
			 <<" date, computed as "<<cj2iso(cjdn,cal)<<std::endl;
}

struct BatchRow{
	int line_no=0;
	std::string raw;
	bool ok=false;
	std::string error;
	long long cjdn=0;
	DatePart part=DatePart::full;
	std::string result;
	long long value=0;
	int weekday=0;
};

void wr_brjs(JsonWriter&w,const BatchRow&row){
	w.obj_begin();
	w.field("line_no",row.line_no);
	w.field("status",row.ok?"ok":"error");
	w.field("raw",row.raw);
	if(row.ok){
		w.field("cjdn",row.cjdn);
		if(row.part==DatePart::full){
			w.field("date",row.result);
		}else{
			w.field(part_key(row.part),row.value);
		}
		w.field("weekday",row.weekday);
	}else{
		w.field("message",row.error);
	}
	w.obj_end();
}

int wr_batch(const std::vector<BatchRow>&rows,const std::string&type,
			 CalKind cal,const std::string&format,const std::string&out_path,
			 bool pretty,bool quiet){
	int err_cnt=0;
	for(const auto&row : rows){
		if(!row.ok){
			++err_cnt;
		}
	}

	OutTgt out=open_out(out_path);
	std::ostream&os=*out.stream;
	if(format=="json"){
		JsonWriter w(os,pretty);
		w.obj_begin();
		write_meta(w,type,cal);
		w.key("data");
		w.obj_begin();
		w.field("ok_count",static_cast<long long>(rows.size())-err_cnt);
		w.field("err_count",err_cnt);
		w.key("rows");
		w.arr_begin();
		for(const auto&row : rows){
			wr_brjs(w,row);
		}
		w.arr_end();
		w.obj_end();
		w.obj_end();
		w.finish();
	}else if(format=="jsonl"){
		for(const auto&row : rows){
			JsonWriter w(os,false);
			wr_brjs(w,row);
			w.finish();
		}
	}else if(format=="csv"){
		os<<"line_no,status,raw,cjdn,result,weekday,message\n";
		for(const auto&row : rows){
			os<<row.line_no<<","<<(row.ok?"ok":"error")<<","<<csv_quote(row.raw)
			  <<",";
			if(row.ok){
				os<<row.cjdn<<","<<csv_quote(row.result)<<","<<row.weekday<<",\n";
			}else{
				os<<",,,"<<csv_quote(row.error)<<"\n";
			}
		}
	}else{
		os<<"tool=cjdn format=txt type="<<type<<" calendar="<<cal_name(cal)
		  <<"\n";
		os<<"line_no\tstatus\traw\tcjdn\tresult\tweekday\tmessage\n";
		for(const auto&row : rows){
			os<<row.line_no<<"\t";
			if(row.ok){
				os<<"ok\t"<<row.raw<<"\t"<<row.cjdn<<"\t"<<row.result<<"\t"
				  <<row.weekday<<"\t\n";
			}else{
				os<<"error\t"<<row.raw<<"\t\t\t\t"<<row.error<<"\n";
			}
		}
	}
	note_out(out_path,quiet);

	if(err_cnt>0&&!quiet){
		std::cerr<<"note: "<<err_cnt<<" of "<<rows.size()<<" lines failed"
				 <<std::endl;
	}
	return (err_cnt==0)?0:1;
}

}

std::string tool_ver(){ return "cjdn 1.0.0"; }

std::vector<CalKind> parse_cals(const std::string&arg){
	std::vector<CalKind> out;
	std::size_t start=0;
	while(start<=arg.size()){
		std::size_t comma=arg.find(',',start);
		if(comma==std::string::npos){
			comma=arg.size();
		}
		std::string item=trim(arg.substr(start,comma-start));
		if(item.empty()){
			throw std::invalid_argument("empty calendar in list: "+arg);
		}
		CalKind kind=parse_cal(item);
		bool dup=false;
		for(CalKind k : out){
			dup=dup||(k==kind);
		}
		if(!dup){
			out.push_back(kind);
		}
		start=comma+1;
	}
	return out;
}

int cli_to(const ToArgs&args){
	const std::string format=to_low(args.format);
	chk_fmt(format,{"json","txt","csv","jsonl"},"to");

	DateIn in=date_in(args);
	long long cjdn=to_cj(args.cal,in,args.strict);
	std::string norm=cj2iso(cjdn,args.cal);
	int dow=day_of_week(cjdn,args.cal);
	note_norm(args.cal,in,cjdn,args.quiet);

	OutTgt out=open_out(args.out);
	std::ostream&os=*out.stream;
	if(format=="json"||format=="jsonl"){
		JsonWriter w(os,(format=="json")?args.pretty:false);
		w.obj_begin();
		write_meta(w,"to",args.cal);
		w.key("input");
		w.obj_begin();
		w.field("text",in.raw);
		w.field("strict",args.strict);
		w.obj_end();
		w.key("data");
		w.obj_begin();
		w.field("cjdn",cjdn);
		w.field("date",norm);
		w.field("weekday",dow);
		w.obj_end();
		w.obj_end();
		w.finish();
	}else if(format=="csv"){
		os<<"calendar,input,cjdn,date,weekday\n";
		os<<cal_name(args.cal)<<","<<csv_quote(in.raw)<<","<<cjdn<<","<<norm
		  <<","<<dow<<"\n";
	}else{
		os<<"tool=cjdn format=txt type=to calendar="<<cal_name(args.cal)<<"\n";
		os<<"input.text="<<in.raw<<"\n";
		os<<"data.cjdn="<<cjdn<<"\n";
		os<<"data.date="<<norm<<"\n";
		os<<"data.weekday="<<dow<<"\n";
	}
	note_out(args.out,args.quiet);
	return 0;
}

int run_tbcli(const ToArgs&args){
	const std::string format=to_low(args.format);
	chk_fmt(format,{"json","txt","csv","jsonl"},"to");
	std::vector<BatchLine> lines=read_bat(args.from_stdin,args.input_file);
	if(lines.empty()){
		throw std::invalid_argument("batch input is empty");
	}

	std::vector<BatchRow> rows;
	rows.reserve(lines.size());
	for(const auto&line : lines){
		BatchRow row;
		row.line_no=line.line_no;
		row.raw=line.raw;
		try{
			DateIn in=date_line(line.raw);
			row.cjdn=to_cj(args.cal,in,args.strict);
			row.result=cj2iso(row.cjdn,args.cal);
			row.weekday=day_of_week(row.cjdn,args.cal);
			row.ok=true;
		}catch(const std::exception&ex){
			row.error=ex.what();
		}
		rows.push_back(row);
	}
	return wr_batch(rows,"to-batch",args.cal,format,args.out,args.pretty,
					args.quiet);
}

int cli_from(const FromArgs&args){
	const std::string format=to_low(args.format);
	chk_fmt(format,{"json","txt","csv","jsonl"},"from");

	long long cjdn=parse_num(args.cjdn_text,"cjdn");
	CjOut res=cj2out(cjdn,args.cal,args.opts);
	int dow=day_of_week(cjdn,args.cal);

	OutTgt out=open_out(args.out);
	std::ostream&os=*out.stream;
	if(format=="json"||format=="jsonl"){
		JsonWriter w(os,(format=="json")?args.pretty:false);
		w.obj_begin();
		write_meta(w,"from",args.cal);
		w.key("input");
		w.obj_begin();
		w.field("cjdn",cjdn);
		w.obj_end();
		w.key("data");
		w.obj_begin();
		if(res.is_text()){
			w.field("date",res.iso);
		}else{
			w.field(part_key(res.part),res.value);
		}
		w.field("weekday",dow);
		w.obj_end();
		w.obj_end();
		w.finish();
	}else if(format=="csv"){
		os<<"calendar,cjdn,part,result,weekday\n";
		os<<cal_name(args.cal)<<","<<cjdn<<","<<part_key(res.part)<<","
		  <<out_text(res)<<","<<dow<<"\n";
	}else{
		os<<"tool=cjdn format=txt type=from calendar="<<cal_name(args.cal)
		  <<"\n";
		os<<"input.cjdn="<<cjdn<<"\n";
		os<<"data."<<part_key(res.part)<<"="<<out_text(res)<<"\n";
		os<<"data.weekday="<<dow<<"\n";
	}
	note_out(args.out,args.quiet);
	return 0;
}

int run_fbcli(const FromArgs&args){
	const std::string format=to_low(args.format);
	chk_fmt(format,{"json","txt","csv","jsonl"},"from");
	std::vector<BatchLine> lines=read_bat(args.from_stdin,args.input_file);
	if(lines.empty()){
		throw std::invalid_argument("batch input is empty");
	}

	std::vector<BatchRow> rows;
	rows.reserve(lines.size());
	for(const auto&line : lines){
		BatchRow row;
		row.line_no=line.line_no;
		row.raw=line.raw;
		try{
			row.cjdn=parse_num(line.raw,"cjdn");
			CjOut res=cj2out(row.cjdn,args.cal,args.opts);
			row.part=res.part;
			row.result=out_text(res);
			row.value=res.value;
			row.weekday=day_of_week(row.cjdn,args.cal);
			row.ok=true;
		}catch(const std::exception&ex){
			row.error=ex.what();
		}
		rows.push_back(row);
	}
	return wr_batch(rows,"from-batch",args.cal,format,args.out,args.pretty,
					args.quiet);
}

int cli_conv(const ConvArgs&args){
	const std::string format=to_low(args.format);
	chk_fmt(format,{"json","txt","csv"},"convert");

	DateIn in=date_line(args.date_text);
	long long cjdn=to_cj(args.cal,in,args.strict);
	note_norm(args.cal,in,cjdn,args.quiet);
	int dow=day_of_week(cjdn,args.cal);
	std::vector<CalKind> targets=args.targets;
	if(targets.empty()){
		targets={CalKind::gregorian,CalKind::milankovic,CalKind::julian};
	}

	OutTgt out=open_out(args.out);
	std::ostream&os=*out.stream;
	if(format=="json"){
		JsonWriter w(os,args.pretty);
		w.obj_begin();
		write_meta(w,"convert",args.cal);
		w.key("input");
		w.obj_begin();
		w.field("text",in.raw);
		w.field("strict",args.strict);
		w.obj_end();
		w.key("data");
		w.obj_begin();
		w.field("cjdn",cjdn);
		w.field("weekday",dow);
		w.field("weekday_name",dow_name(dow));
		w.key("dates");
		w.obj_begin();
		for(CalKind k : targets){
			w.field(cal_name(k),cj2iso(cjdn,k));
		}
		w.obj_end();
		w.obj_end();
		w.obj_end();
		w.finish();
	}else if(format=="csv"){
		os<<"calendar,date,cjdn,weekday\n";
		for(CalKind k : targets){
			os<<cal_name(k)<<","<<cj2iso(cjdn,k)<<","<<cjdn<<","<<dow<<"\n";
		}
	}else{
		os<<"tool=cjdn format=txt type=convert calendar="<<cal_name(args.cal)
		  <<"\n";
		os<<"input.text="<<in.raw<<"\n";
		os<<"data.cjdn="<<cjdn<<"\n";
		os<<"data.weekday="<<dow<<" ("<<dow_name(dow)<<")\n";
		os<<"calendar\tdate\n";
		for(CalKind k : targets){
			os<<cal_name(k)<<"\t"<<cj2iso(cjdn,k)<<"\n";
		}
	}
	note_out(args.out,args.quiet);
	return 0;
}

int cli_dow(const DowArgs&args){
	const std::string format=to_low(args.format);
	chk_fmt(format,{"json","txt"},"dow");

	long long cjdn=0;
	if(!args.date_text.empty()){
		DateIn in=date_line(args.date_text);
		cjdn=to_cj(args.cal,in,false);
		note_norm(args.cal,in,cjdn,args.quiet);
	}else{
		cjdn=parse_num(args.cjdn_text,"cjdn");
	}
	int dow=day_of_week(cjdn,args.cal);

	OutTgt out=open_out(args.out);
	std::ostream&os=*out.stream;
	if(format=="json"){
		JsonWriter w(os,args.pretty);
		w.obj_begin();
		write_meta(w,"dow",args.cal);
		w.key("data");
		w.obj_begin();
		w.field("cjdn",cjdn);
		w.field("weekday",dow);
		w.field("name",dow_name(dow));
		w.obj_end();
		w.obj_end();
		w.finish();
	}else{
		os<<"tool=cjdn format=txt type=dow calendar="<<cal_name(args.cal)
		  <<"\n";
		os<<"data.cjdn="<<cjdn<<"\n";
		os<<"data.weekday="<<dow<<"\n";
		os<<"data.name="<<dow_name(dow)<<"\n";
	}
	note_out(args.out,args.quiet);
	return 0;
}

int cmd_to(const std::vector<std::string>&args){
	if(is_help(args)){
		use_to();
		return 0;
	}

	InterCfg cfg=load_def();
	ToArgs t;
	t.cal=parse_cal(cfg.def_cal);
	t.strict=cfg.strict;
	t.format=pick_fmt(cfg,{"json","txt","csv","jsonl"});
	t.pretty=cfg.def_prety;

	OptMap handlers;
	add_out(handlers,t.format,t.out,t.pretty,t.quiet);
	add_batch(handlers,t.from_stdin,t.input_file);
	handlers["--strict"]=[&t](const std::vector<std::string>&src,
							  std::size_t&idx,const std::string&opt){
		t.strict=parse_bool01(req_val(src,idx,opt),"--strict");
	};
	std::vector<std::string> pos=split_args(handlers,args,"to");

	if(t.from_stdin||!t.input_file.empty()){
		if(pos.size()>1){
			throw std::invalid_argument("to with --stdin/--file accepts only [<cal>]");
		}
		if(pos.size()==1){
			t.cal=parse_cal(pos[0]);
		}
		return run_tbcli(t);
	}

	switch(pos.size()){
	case 1:
		t.date_text=pos[0];
		break;
	case 2:
		t.cal=parse_cal(pos[0]);
		t.date_text=pos[1];
		break;
	case 3:
		t.year=pos[0];
		t.month=pos[1];
		t.day=pos[2];
		break;
	case 4:
		t.cal=parse_cal(pos[0]);
		t.year=pos[1];
		t.month=pos[2];
		t.day=pos[3];
		break;
	default:
		throw std::invalid_argument(
			"to requires: [<cal>] <YYYY-MM-DD> or [<cal>] <year> <month> <day>");
	}
	return cli_to(t);
}

int cmd_from(const std::vector<std::string>&args){
	if(is_help(args)){
		use_from();
		return 0;
	}

	InterCfg cfg=load_def();
	FromArgs f;
	f.cal=parse_cal(cfg.def_cal);
	f.format=pick_fmt(cfg,{"json","txt","csv","jsonl"});
	f.pretty=cfg.def_prety;

	OptMap handlers;
	add_out(handlers,f.format,f.out,f.pretty,f.quiet);
	add_batch(handlers,f.from_stdin,f.input_file);
	handlers["--year"]=[&f](const std::vector<std::string>&,std::size_t&,
							const std::string&){ f.opts.ret_year=true; };
	handlers["--month"]=[&f](const std::vector<std::string>&,std::size_t&,
							 const std::string&){ f.opts.ret_month=true; };
	handlers["--day"]=[&f](const std::vector<std::string>&,std::size_t&,
						   const std::string&){ f.opts.ret_day=true; };
	std::vector<std::string> pos=split_args(handlers,args,"from");

	if(f.from_stdin||!f.input_file.empty()){
		if(pos.size()>1){
			throw std::invalid_argument(
				"from with --stdin/--file accepts only [<cal>]");
		}
		if(pos.size()==1){
			f.cal=parse_cal(pos[0]);
		}
		return run_fbcli(f);
	}

	if(pos.size()==1){
		f.cjdn_text=pos[0];
	}else if(pos.size()==2){
		f.cal=parse_cal(pos[0]);
		f.cjdn_text=pos[1];
	}else{
		throw std::invalid_argument("from requires: [<cal>] <cjdn>");
	}
	return cli_from(f);
}

int cmd_conv(const std::vector<std::string>&args){
	if(is_help(args)){
		use_conv();
		return 0;
	}

	InterCfg cfg=load_def();
	ConvArgs c;
	c.cal=parse_cal(cfg.def_cal);
	c.strict=cfg.strict;
	c.format=pick_fmt(cfg,{"json","txt","csv"});
	c.pretty=cfg.def_prety;

	OptMap handlers;
	add_out(handlers,c.format,c.out,c.pretty,c.quiet);
	handlers["--to"]=[&c](const std::vector<std::string>&src,std::size_t&idx,
						  const std::string&opt){
		c.targets=parse_cals(req_val(src,idx,opt));
	};
	handlers["--strict"]=[&c](const std::vector<std::string>&src,
							  std::size_t&idx,const std::string&opt){
		c.strict=parse_bool01(req_val(src,idx,opt),"--strict");
	};
	std::vector<std::string> pos=split_args(handlers,args,"convert");

	if(pos.size()==1){
		c.date_text=pos[0];
	}else if(pos.size()==2){
		c.cal=parse_cal(pos[0]);
		c.date_text=pos[1];
	}else{
		throw std::invalid_argument("convert requires: [<cal>] <YYYY-MM-DD>");
	}
	return cli_conv(c);
}

int cmd_dow(const std::vector<std::string>&args){
	if(is_help(args)){
		use_dow();
		return 0;
	}

	InterCfg cfg=load_def();
	DowArgs d;
	d.cal=parse_cal(cfg.def_cal);
	d.format=pick_fmt(cfg,{"json","txt"});
	d.pretty=cfg.def_prety;

	OptMap handlers;
	add_out(handlers,d.format,d.out,d.pretty,d.quiet);
	std::vector<std::string> pos=split_args(handlers,args,"dow");

	if(pos.size()==1){
		d.cjdn_text=pos[0];
	}else if(pos.size()==2){
		d.cal=parse_cal(pos[0]);
		if(is_int(pos[1])){
			d.cjdn_text=pos[1];
		}else{
			d.date_text=pos[1];
		}
	}else{
		throw std::invalid_argument(
			"dow requires: <cjdn>, <cal> <cjdn> or <cal> <YYYY-MM-DD>");
	}
	return cli_dow(d);
}

void use_to(){
	std::cout<<"Usage:\n"
			 <<"  cjdn to [<cal>] <YYYY-MM-DD>\n"
			 <<"  cjdn to [<cal>] <year> <month> <day>\n"
			 <<"  cjdn to [<cal>] --stdin | --file <path>\n"
			 <<"    [--strict 0|1] [--format json|txt|csv|jsonl] [--out ...]\n"
			 <<"    [--pretty 0|1] [--quiet]\n"
			 <<"Calendars:\n"
			 <<"  gregorian (g, 3) | milankovic (m, revised, 2) | julian (j, 1)\n"
			 <<"Examples:\n"
			 <<"  cjdn to gregorian 2000-01-01\n"
			 <<"  cjdn to julian -4712 1 1\n"
			 <<"  cjdn to milankovic --file dates.txt --format csv\n"
			 <<"Notes:\n"
			 <<"  Without --strict 1, impossible dates such as 1900-02-29 are\n"
			 <<"  computed arithmetically (here as 1900-03-01).\n";
}

void use_from(){
	std::cout<<"Usage:\n"
			 <<"  cjdn from [<cal>] <cjdn> [--year] [--month] [--day]\n"
			 <<"  cjdn from [<cal>] --stdin | --file <path>\n"
			 <<"    [--format json|txt|csv|jsonl] [--out ...] [--pretty 0|1] "
			   "[--quiet]\n"
			 <<"Examples:\n"
			 <<"  cjdn from gregorian 2451545\n"
			 <<"  cjdn from julian 0 --year\n"
			 <<"Notes:\n"
			 <<"  With several of --year/--month/--day, the first in that order "
			   "wins.\n";
}

void use_conv(){
	std::cout<<"Usage:\n"
			 <<"  cjdn convert [<cal>] <YYYY-MM-DD> [--to <cal[,cal...]>]\n"
			 <<"    [--strict 0|1] [--format json|txt|csv] [--out ...] "
			   "[--pretty 0|1] [--quiet]\n"
			 <<"Examples:\n"
			 <<"  cjdn convert julian 1582-10-04\n"
			 <<"  cjdn convert gregorian 2800-02-29 --to milankovic\n";
}

void use_dow(){
	std::cout<<"Usage:\n"
			 <<"  cjdn dow <cjdn>\n"
			 <<"  cjdn dow <cal> <cjdn>\n"
			 <<"  cjdn dow <cal> <YYYY-MM-DD>\n"
			 <<"    [--format json|txt] [--out ...] [--pretty 0|1] [--quiet]\n"
			 <<"Examples:\n"
			 <<"  cjdn dow 2451547\n"
			 <<"  cjdn dow julian 1582-10-04\n"
			 <<"Notes:\n"
			 <<"  ISO 8601 numbering: Monday=1 .. Sunday=7.\n";
}

void use_main(){
	std::cout<<"Usage:\n"
			 <<"  cjdn --help\n"
			 <<"  cjdn --version\n"
			 <<"  cjdn                # interactive menu\n"
			 <<"  cjdn to        ...\n"
			 <<"  cjdn from      ...\n"
			 <<"  cjdn convert   ...\n"
			 <<"  cjdn dow       ...\n"
			 <<"  cjdn selftest  ...\n"
			 <<"  cjdn config    ...\n"
			 <<"  cjdn completion...\n"
			 <<"\n"
			 <<"Subcommand help:\n"
			 <<"  cjdn to --help\n"
			 <<"  cjdn from --help\n"
			 <<"  cjdn convert --help\n"
			 <<"  cjdn dow --help\n"
			 <<"  cjdn selftest --help\n"
			 <<"  cjdn config --help\n"
			 <<"  cjdn completion --help\n";
}
