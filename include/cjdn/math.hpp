#pragma once

#include<stdexcept>

// Zero points of the day-number formulas (CJDN of the reference day minus
// the offsets absorbed by the March-based month numbering).
constexpr long long GREG_EPOCH=1721119;
constexpr long long GREG_EPOCH_INV=1721120;
constexpr long long JUL_EPOCH=1721117;
constexpr long long JUL_EPOCH_INV=1721118;

constexpr long long DAYS_4Y=1461;
constexpr long long DAYS_100Y_X100=36525;
constexpr long long GREG_DAYS_400Y=146097;
constexpr long long MILK_DAYS_900Y=328718;
constexpr long long MILK_PHASE=6;
constexpr long long MILK_PHASE_INV=2;
constexpr long long DAYS_5MON=153;

constexpr long long WEEKDAY_OFFSET=0;

// Input bounds that keep every formula intermediate inside 64 bits. Any
// CJDN within +-CJDN_LIMIT converts to a year within +-YEAR_LIMIT and back.
constexpr long long CJDN_LIMIT=1000000000000000000LL;
constexpr long long YEAR_LIMIT=2800000000000000LL;
constexpr long long MONTH_LIMIT=1000000000000LL;
constexpr long long DAY_LIMIT=1000000000000000LL;

// Quotient rounded toward negative infinity. b must be non-zero.
inline long long floor_div(long long a,long long b){
	if(b==0){
		throw std::domain_error("floor_div by zero");
	}
	long long q=a/b;
	long long r=a%b;
	if(r!=0&&((r<0)!=(b<0))){
		--q;
	}
	return q;
}

// Remainder with the sign of the divisor, so a == floor_div(a,b)*b+floor_mod(a,b).
inline long long floor_mod(long long a,long long b){
	if(b==0){
		throw std::domain_error("floor_mod by zero");
	}
	long long r=a%b;
	if(r!=0&&((r<0)!=(b<0))){
		r+=b;
	}
	return r;
}
