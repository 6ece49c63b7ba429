#include "cjdn/calendar.hpp"

#include<cctype>
#include<stdexcept>

#include "cjdn/format.hpp"
#include "cjdn/math.hpp"

namespace{

// Year/month re-based on March so the leap day is the last day of the year.
struct MarchYmd{
	long long cent;
	long long yr_cent;
	long long mon;
};

MarchYmd to_march(long long year,long long month){
	long long c0=floor_div(month-3,12);
	long long x4=year+c0;
	MarchYmd out;
	out.cent=floor_div(x4,100);
	out.yr_cent=floor_mod(x4,100);
	out.mon=month-12*c0-3;
	return out;
}

long long mon_year_days(const MarchYmd&my,long long day){
	return floor_div(DAYS_100Y_X100*my.yr_cent,100)+
		   floor_div(DAYS_5MON*my.mon+2,5)+day;
}

// Shared tail of the inverse formulas: k2 counts quarter-days into the
// century scaled by 100.
CalDate from_k2(long long cent,long long k2){
	long long x2=floor_div(k2,DAYS_100Y_X100);
	long long k1=5*floor_div(floor_mod(k2,DAYS_100Y_X100),100)+2;
	long long x1=floor_div(k1,DAYS_5MON);
	long long c0=floor_div(x1+2,12);

	CalDate out;
	out.year=100*cent+x2+c0;
	out.month=static_cast<int>(x1-12*c0+3);
	out.day=static_cast<int>(floor_div(floor_mod(k1,DAYS_5MON),5)+1);
	return out;
}

CjOut mk_out(const CalDate&date,const CjOpts&opts){
	CjOut out;
	out.part=pick_part(opts);
	out.date=date;
	switch(out.part){
	case DatePart::year:
		out.value=date.year;
		break;
	case DatePart::month:
		out.value=date.month;
		break;
	case DatePart::day:
		out.value=date.day;
		break;
	case DatePart::full:
		out.iso=fmt_ymd(date.year,date.month,date.day);
		break;
	}
	return out;
}

void chk_lim(long long v,long long limit,const char*label){
	if(v<-limit||v>limit){
		throw std::out_of_range(std::string(label)+" out of range: "+
								std::to_string(v)+" (limit +-"+
								std::to_string(limit)+")");
	}
}

void chk_ymd(long long year,long long month,long long day){
	chk_lim(year,YEAR_LIMIT,"year");
	chk_lim(month,MONTH_LIMIT,"month");
	chk_lim(day,DAY_LIMIT,"day");
}

// Forward results are held to the CJDN range so they always convert back.
long long chk_cj(long long cjdn){
	chk_lim(cjdn,CJDN_LIMIT,"CJDN");
	return cjdn;
}

void chk_kind(CalKind kind){
	switch(kind){
	case CalKind::julian:
	case CalKind::milankovic:
	case CalKind::gregorian:
		return;
	}
	throw std::invalid_argument("unknown calendar code: "+
								std::to_string(static_cast<int>(kind)));
}

}

DatePart pick_part(const CjOpts&opts){
	if(opts.ret_year){
		return DatePart::year;
	}
	if(opts.ret_month){
		return DatePart::month;
	}
	if(opts.ret_day){
		return DatePart::day;
	}
	return DatePart::full;
}

CalKind cal_from_int(int code){
	switch(code){
	case 1:
		return CalKind::julian;
	case 2:
		return CalKind::milankovic;
	case 3:
		return CalKind::gregorian;
	default:
		break;
	}
	throw std::invalid_argument("calendar code must be 1, 2 or 3: "+
								std::to_string(code));
}

CalKind parse_cal(const std::string&text){
	std::string s;
	s.reserve(text.size());
	for(char c : text){
		s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
	}
	if(s=="gregorian"||s=="greg"||s=="g"||s=="3"){
		return CalKind::gregorian;
	}
	if(s=="milankovic"||s=="milk"||s=="revised"||s=="rj"||s=="m"||s=="2"){
		return CalKind::milankovic;
	}
	if(s=="julian"||s=="jul"||s=="j"||s=="1"){
		return CalKind::julian;
	}
	throw std::invalid_argument(
		"invalid calendar, expected gregorian|milankovic|julian: "+text);
}

const char*cal_name(CalKind kind){
	switch(kind){
	case CalKind::julian:
		return "julian";
	case CalKind::milankovic:
		return "milankovic";
	case CalKind::gregorian:
		return "gregorian";
	}
	return "unknown";
}

long long greg2cj(long long year,long long month,long long day){
	chk_ymd(year,month,day);
	MarchYmd my=to_march(year,month);
	return chk_cj(floor_div(GREG_DAYS_400Y*my.cent,4)+mon_year_days(my,day)+
				  GREG_EPOCH);
}

long long milk2cj(long long year,long long month,long long day){
	chk_ymd(year,month,day);
	MarchYmd my=to_march(year,month);
	return chk_cj(floor_div(MILK_DAYS_900Y*my.cent+MILK_PHASE,9)+
				  mon_year_days(my,day)+GREG_EPOCH);
}

long long jul2cj(long long year,long long month,long long day){
	chk_ymd(year,month,day);
	long long c0=floor_div(month-3,12);
	long long j1=floor_div((c0+year)*DAYS_4Y,4);
	long long j2=floor_div(DAYS_5MON*month-1836*c0-457,5);
	return chk_cj(j1+j2+day+JUL_EPOCH);
}

long long greg2cj(const std::string&year,const std::string&month,
				  const std::string&day){
	return greg2cj(parse_num(year,"year"),parse_num(month,"month"),
				   parse_num(day,"day"));
}

long long milk2cj(const std::string&year,const std::string&month,
				  const std::string&day){
	return milk2cj(parse_num(year,"year"),parse_num(month,"month"),
				   parse_num(day,"day"));
}

long long jul2cj(const std::string&year,const std::string&month,
				 const std::string&day){
	return jul2cj(parse_num(year,"year"),parse_num(month,"month"),
				  parse_num(day,"day"));
}

long long cal2cj(CalKind kind,long long year,long long month,long long day){
	switch(kind){
	case CalKind::julian:
		return jul2cj(year,month,day);
	case CalKind::milankovic:
		return milk2cj(year,month,day);
	case CalKind::gregorian:
		return greg2cj(year,month,day);
	}
	chk_kind(kind);
	return 0;
}

long long cal2cj(CalKind kind,const CalDate&date){
	return cal2cj(kind,date.year,date.month,date.day);
}

CalDate cj_greg(long long cjdn){
	chk_cj(cjdn);
	long long k3=4*(cjdn-GREG_EPOCH_INV)+3;
	long long x3=floor_div(k3,GREG_DAYS_400Y);
	long long k2=100*floor_div(floor_mod(k3,GREG_DAYS_400Y),4)+99;
	return from_k2(x3,k2);
}

CalDate cj_milk(long long cjdn){
	chk_cj(cjdn);
	long long k3=9*(cjdn-GREG_EPOCH_INV)+MILK_PHASE_INV;
	long long x3=floor_div(k3,MILK_DAYS_900Y);
	long long k2=100*floor_div(floor_mod(k3,MILK_DAYS_900Y),9)+99;
	return from_k2(x3,k2);
}

CalDate cj_jul(long long cjdn){
	chk_cj(cjdn);
	long long k2=4*(cjdn-JUL_EPOCH_INV)+3;
	long long k1=5*floor_div(floor_mod(k2,DAYS_4Y),4)+2;
	long long x1=floor_div(k1,DAYS_5MON);
	long long c0=floor_div(x1+2,12);

	CalDate out;
	out.year=floor_div(k2,DAYS_4Y)+c0;
	out.month=static_cast<int>(x1-12*c0+3);
	out.day=static_cast<int>(floor_div(floor_mod(k1,DAYS_5MON),5)+1);
	return out;
}

CalDate cj2cal(long long cjdn,CalKind kind){
	switch(kind){
	case CalKind::julian:
		return cj_jul(cjdn);
	case CalKind::milankovic:
		return cj_milk(cjdn);
	case CalKind::gregorian:
		return cj_greg(cjdn);
	}
	chk_kind(kind);
	return CalDate();
}

CjOut cj2greg(long long cjdn,const CjOpts&opts){
	return mk_out(cj_greg(cjdn),opts);
}

CjOut cj2milk(long long cjdn,const CjOpts&opts){
	return mk_out(cj_milk(cjdn),opts);
}

CjOut cj2jul(long long cjdn,const CjOpts&opts){
	return mk_out(cj_jul(cjdn),opts);
}

CjOut cj2out(long long cjdn,CalKind kind,const CjOpts&opts){
	return mk_out(cj2cal(cjdn,kind),opts);
}

std::string cj2iso(long long cjdn,CalKind kind){
	CalDate d=cj2cal(cjdn,kind);
	return fmt_ymd(d.year,d.month,d.day);
}

int day_of_week(long long cjdn,CalKind kind){
	chk_kind(kind);
	return static_cast<int>(floor_mod(cjdn+WEEKDAY_OFFSET,7))+1;
}

int dow_cong(CalKind kind,const CalDate&date){
	chk_kind(kind);
	chk_ymd(date.year,date.month,date.day);
	long long a=floor_div(14-date.month,12);
	long long y=date.year-a;
	long long m=date.month+12*a-2;
	long long base=date.day+y+floor_div(y,4)+floor_div(31*m,12);

	long long r=0;
	switch(kind){
	case CalKind::julian:
		r=floor_mod(5+base,7);
		break;
	case CalKind::milankovic:
		r=floor_mod(base-floor_div(y,100)+floor_div(y+300,900)+
						floor_div(y+700,900),
					7);
		break;
	case CalKind::gregorian:
		r=floor_mod(base-floor_div(y,100)+floor_div(y,400),7);
		break;
	}
	return r==0?7:static_cast<int>(r);
}

bool is_leap(CalKind kind,long long year){
	chk_kind(kind);
	if(floor_mod(year,4)!=0){
		return false;
	}
	switch(kind){
	case CalKind::julian:
		return true;
	case CalKind::gregorian:
		return floor_mod(year,100)!=0||floor_mod(year,400)==0;
	case CalKind::milankovic:{
		if(floor_mod(year,100)!=0){
			return true;
		}
		long long r=floor_mod(year,900);
		return r==200||r==600;
	}
	}
	return false;
}

int mon_days(CalKind kind,long long year,int month){
	static const int kDays[12]={31,28,31,30,31,30,31,31,30,31,30,31};
	if(month<1||month>12){
		throw std::out_of_range("month out of range: "+std::to_string(month));
	}
	if(month==2&&is_leap(kind,year)){
		return 29;
	}
	return kDays[month-1];
}

bool valid_date(CalKind kind,long long year,long long month,long long day){
	if(month<1||month>12||day<1){
		return false;
	}
	return day<=mon_days(kind,year,static_cast<int>(month));
}

void chk_date(CalKind kind,long long year,long long month,long long day){
	chk_kind(kind);
	if(month<1||month>12){
		throw std::out_of_range("month out of range: "+std::to_string(month));
	}
	int max_day=mon_days(kind,year,static_cast<int>(month));
	if(day<1||day>max_day){
		throw std::out_of_range("day out of range for "+
								std::string(cal_name(kind))+" "+
								fmt_year(year)+"-"+
								(month<10?"0":"")+std::to_string(month)+": "+
								std::to_string(day));
	}
}

long long cal2cj_strict(CalKind kind,long long year,long long month,
						long long day){
	chk_date(kind,year,month,day);
	return cal2cj(kind,year,month,day);
}
