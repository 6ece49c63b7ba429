#include<gtest/gtest.h>

#include<stdexcept>

#include "cjdn/math.hpp"

TEST(FloorDiv,MatchesTruncationForNonNegative){
	EXPECT_EQ(floor_div(7,2),3);
	EXPECT_EQ(floor_div(6,3),2);
	EXPECT_EQ(floor_div(0,5),0);
}

TEST(FloorDiv,RoundsTowardNegativeInfinity){
	EXPECT_EQ(floor_div(-7,2),-4);
	EXPECT_EQ(floor_div(-6,3),-2);
	EXPECT_EQ(floor_div(-1,146097),-1);
	EXPECT_EQ(floor_div(7,-2),-4);
	EXPECT_EQ(floor_div(-7,-2),3);
}

TEST(FloorMod,TakesSignOfDivisor){
	EXPECT_EQ(floor_mod(-1,7),6);
	EXPECT_EQ(floor_mod(-7,7),0);
	EXPECT_EQ(floor_mod(-8,7),6);
	EXPECT_EQ(floor_mod(8,-7),-6);
	EXPECT_EQ(floor_mod(13,100),13);
}

TEST(FloorMod,ReconstructsDividend){
	for(long long a=-50;a<=50;++a){
		for(long long b : {-9LL,-4LL,3LL,7LL,100LL}){
			EXPECT_EQ(floor_div(a,b)*b+floor_mod(a,b),a) << a << " " << b;
		}
	}
}

TEST(FloorDiv,ZeroDivisorThrows){
	EXPECT_THROW(floor_div(1,0),std::domain_error);
	EXPECT_THROW(floor_mod(1,0),std::domain_error);
}
