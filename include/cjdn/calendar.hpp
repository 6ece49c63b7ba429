#pragma once

#include<string>

enum class CalKind{
	julian=1,
	milankovic=2,
	gregorian=3,
};

struct CalDate{
	long long year=0;
	int month=1;
	int day=1;
};

// Which part of an inverse conversion the caller wants back.
enum class DatePart{
	full,
	year,
	month,
	day,
};

struct CjOpts{
	bool ret_year=false;
	bool ret_month=false;
	bool ret_day=false;
};

struct CjOut{
	DatePart part=DatePart::full;
	CalDate date;
	std::string iso;
	long long value=0;

	bool is_text() const{ return part==DatePart::full; }
};

// Year wins over month, month over day.
DatePart pick_part(const CjOpts&opts);

CalKind cal_from_int(int code);

CalKind parse_cal(const std::string&text);

const char*cal_name(CalKind kind);

/*
 * Calendar date -> CJDN. Month and day are not range checked: any integer
 * triple maps to a deterministic day number, e.g. Gregorian 1900-02-29
 * lands on 1900-03-01. The string overloads parse each field first and
 * throw ParseError on non-numeric text.
 */
long long greg2cj(long long year,long long month,long long day);
long long milk2cj(long long year,long long month,long long day);
long long jul2cj(long long year,long long month,long long day);

long long greg2cj(const std::string&year,const std::string&month,
				  const std::string&day);
long long milk2cj(const std::string&year,const std::string&month,
				  const std::string&day);
long long jul2cj(const std::string&year,const std::string&month,
				 const std::string&day);

long long cal2cj(CalKind kind,long long year,long long month,long long day);

long long cal2cj(CalKind kind,const CalDate&date);

// CJDN -> calendar date, any CJDN accepted.
CalDate cj_greg(long long cjdn);
CalDate cj_milk(long long cjdn);
CalDate cj_jul(long long cjdn);

CalDate cj2cal(long long cjdn,CalKind kind);

CjOut cj2greg(long long cjdn,const CjOpts&opts=CjOpts());
CjOut cj2milk(long long cjdn,const CjOpts&opts=CjOpts());
CjOut cj2jul(long long cjdn,const CjOpts&opts=CjOpts());

CjOut cj2out(long long cjdn,CalKind kind,const CjOpts&opts=CjOpts());

std::string cj2iso(long long cjdn,CalKind kind);

// ISO 8601 weekday, Monday=1 .. Sunday=7. The weekday of a day number does
// not depend on the calendar; kind only has to be a known calendar.
int day_of_week(long long cjdn,CalKind kind=CalKind::gregorian);

// Weekday straight from a calendar date by that calendar's congruence.
int dow_cong(CalKind kind,const CalDate&date);

bool is_leap(CalKind kind,long long year);

int mon_days(CalKind kind,long long year,int month);

bool valid_date(CalKind kind,long long year,long long month,long long day);

void chk_date(CalKind kind,long long year,long long month,long long day);

long long cal2cj_strict(CalKind kind,long long year,long long month,
						long long day);
