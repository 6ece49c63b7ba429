#include<gtest/gtest.h>

#include<cstdio>
#include<cstdlib>
#include<fstream>
#include<iostream>
#include<sstream>
#include<stdexcept>
#include<string>
#include<vector>

#include "cjdn/cli.hpp"
#include "cjdn/entry.hpp"
#include "cjdn/interact.hpp"

namespace{

class CoutCap{
  public:
	CoutCap():old_(std::cout.rdbuf(buf_.rdbuf())){}
	~CoutCap(){ std::cout.rdbuf(old_); }

	std::string str() const{ return buf_.str(); }

  private:
	std::ostringstream buf_;
	std::streambuf*old_;
};

class CerrCap{
  public:
	CerrCap():old_(std::cerr.rdbuf(buf_.rdbuf())){}
	~CerrCap(){ std::cerr.rdbuf(old_); }

	std::string str() const{ return buf_.str(); }

  private:
	std::ostringstream buf_;
	std::streambuf*old_;
};

std::string slurp(const std::string&path){
	std::ifstream ifs(path,std::ios::binary);
	std::ostringstream oss;
	oss<<ifs.rdbuf();
	return oss.str();
}

class CliTest : public ::testing::Test{
  protected:
	void SetUp() override{
		const auto*info=::testing::UnitTest::GetInstance()->current_test_info();
		prefix_=::testing::TempDir()+"cjdn_"+info->name();
		cfg_=prefix_+"_cfg.txt";
		std::remove(cfg_.c_str());
		setenv("CJDN_CONFIG",cfg_.c_str(),1);
	}

	void TearDown() override{
		std::remove(cfg_.c_str());
		for(const auto&p : extra_){
			std::remove(p.c_str());
		}
		unsetenv("CJDN_CONFIG");
	}

	std::string tmp(const std::string&name,const std::string&content=""){
		std::string path=prefix_+"_"+name;
		if(!content.empty()){
			std::ofstream ofs(path,std::ios::binary);
			ofs<<content;
		}
		extra_.push_back(path);
		return path;
	}

	std::string run(int(*cmd)(const std::vector<std::string>&),
					const std::vector<std::string>&args,int want=0){
		CoutCap cap;
		EXPECT_EQ(cmd(args),want);
		return cap.str();
	}

	std::string prefix_;
	std::string cfg_;
	std::vector<std::string> extra_;
};

}

TEST_F(CliTest,ToPrintsTxtRecord){
	EXPECT_EQ(run(cmd_to,{"gregorian","2000-01-01"}),
			  "tool=cjdn format=txt type=to calendar=gregorian\n"
			  "input.text=2000-01-01\n"
			  "data.cjdn=2451545\n"
			  "data.date=2000-01-01\n"
			  "data.weekday=6\n");
}

TEST_F(CliTest,ToAcceptsSeparateFieldsWithNegativeYear){
	EXPECT_EQ(run(cmd_to,{"julian","-4712","1","1","--format","csv"}),
			  "calendar,input,cjdn,date,weekday\n"
			  "julian,-4712 1 1,0,-4712-01-01,1\n");
}

TEST_F(CliTest,ToJson){
	EXPECT_EQ(run(cmd_to,{"m","2800-02-29","--format","json","--pretty","0",
						  "--quiet"}),
			  "{\"meta\":{\"tool\":\"cjdn\",\"version\":\"cjdn 1.0.0\","
			  "\"schema\":\"cjdn.v1\",\"type\":\"to\",\"calendar\":"
			  "\"milankovic\"},\"input\":{\"text\":\"2800-02-29\","
			  "\"strict\":false},\"data\":{\"cjdn\":2743798,\"date\":"
			  "\"2800-03-01\",\"weekday\":2}}\n");
}

TEST_F(CliTest,ToRollsOverWithoutStrict){
	std::string out=run(cmd_to,{"gregorian","1900-02-29","--quiet"});
	EXPECT_NE(out.find("data.cjdn=2415080\n"),std::string::npos);
	EXPECT_NE(out.find("data.date=1900-03-01\n"),std::string::npos);
}

TEST_F(CliTest,ToStrictRejects){
	EXPECT_THROW(cmd_to({"gregorian","1900-02-29","--strict","1"}),
				 std::out_of_range);
	EXPECT_THROW(cmd_to({"gregorian","2000-01-01","--strict","yes"}),
				 std::invalid_argument);
}

TEST_F(CliTest,ToArgumentErrors){
	EXPECT_THROW(cmd_to({"gregorian","2000-01-01","--bogus"}),
				 std::invalid_argument);
	EXPECT_THROW(cmd_to({"gregorian","2000-01-01","--out"}),
				 std::invalid_argument);
	EXPECT_THROW(cmd_to({}),std::invalid_argument);
	EXPECT_THROW(cmd_to({"gregorian","2000-01-01","--format","xml"}),
				 std::invalid_argument);
	EXPECT_THROW(cmd_to({"hebrew","2000-01-01"}),std::invalid_argument);
	EXPECT_THROW(cmd_to({"gregorian","2000-01-xx"}),std::invalid_argument);
}

TEST_F(CliTest,FromFullDate){
	std::string out=run(cmd_from,{"julian","0"});
	EXPECT_EQ(out,"tool=cjdn format=txt type=from calendar=julian\n"
				  "input.cjdn=0\n"
				  "data.date=-4712-01-01\n"
				  "data.weekday=1\n");
}

TEST_F(CliTest,FromYearWinsOverDay){
	EXPECT_EQ(run(cmd_from,{"gregorian","2451545","--day","--year","--format",
							"json","--pretty","0"}),
			  "{\"meta\":{\"tool\":\"cjdn\",\"version\":\"cjdn 1.0.0\","
			  "\"schema\":\"cjdn.v1\",\"type\":\"from\",\"calendar\":"
			  "\"gregorian\"},\"input\":{\"cjdn\":2451545},\"data\":{"
			  "\"year\":2000,\"weekday\":6}}\n");
}

TEST_F(CliTest,FromNegativeCjdn){
	std::string out=run(cmd_from,{"gregorian","-100000"});
	EXPECT_NE(out.find("data.date=-4986-02-09\n"),std::string::npos);
}

TEST_F(CliTest,FromBatchReportsEveryLine){
	std::string in=tmp("in.txt","2451545\n# comment\n\nabc\n0\n");
	EXPECT_EQ(run(cmd_from,{"gregorian","--file",in,"--format","csv",
							"--quiet"},
				  1),
			  "line_no,status,raw,cjdn,result,weekday,message\n"
			  "1,ok,2451545,2451545,2000-01-01,6,\n"
			  "4,error,abc,,,,invalid cjdn: abc\n"
			  "5,ok,0,0,-4713-11-24,1,\n");
}

TEST_F(CliTest,FromBatchJsonlWithPart){
	std::string in=tmp("in.txt","2451545\n0\n");
	EXPECT_EQ(run(cmd_from,{"julian","--file",in,"--month","--format","jsonl"}),
			  "{\"line_no\":1,\"status\":\"ok\",\"raw\":\"2451545\","
			  "\"cjdn\":2451545,\"month\":12,\"weekday\":6}\n"
			  "{\"line_no\":2,\"status\":\"ok\",\"raw\":\"0\",\"cjdn\":0,"
			  "\"month\":1,\"weekday\":1}\n");
}

TEST_F(CliTest,ToBatchJson){
	std::string in=tmp("in.txt","2000-01-01\n-4712 1 1\n");
	std::string out=run(cmd_to,{"julian","--file",in,"--format","json",
								"--pretty","0"});
	EXPECT_NE(out.find("\"type\":\"to-batch\""),std::string::npos);
	EXPECT_NE(out.find("\"ok_count\":2,\"err_count\":0"),std::string::npos);
	EXPECT_NE(out.find("\"raw\":\"-4712 1 1\",\"cjdn\":0"),std::string::npos);
}

TEST_F(CliTest,ToBatchStrictFailsLine){
	std::string in=tmp("in.txt","2000-02-29\n1900-02-29\n");
	std::string out=run(cmd_to,{"gregorian","--file",in,"--strict","1",
								"--quiet"},
						1);
	EXPECT_NE(out.find("1\tok\t2000-02-29\t2451604\t2000-02-29\t2\t\n"),
			  std::string::npos);
	EXPECT_NE(out.find("2\terror\t1900-02-29\t\t\t\tday out of range for "
					   "gregorian 1900-02: 29\n"),
			  std::string::npos);
}

TEST_F(CliTest,BatchInputErrors){
	EXPECT_THROW(cmd_to({"--stdin","--file","x.txt"}),std::invalid_argument);
	EXPECT_THROW(cmd_from({"--file",prefix_+"_missing.txt"}),
				 std::runtime_error);
	std::string empty=tmp("empty.txt","# nothing\n");
	EXPECT_THROW(cmd_from({"--file",empty}),std::invalid_argument);
}

TEST_F(CliTest,ConvertShowsAllCalendars){
	EXPECT_EQ(run(cmd_conv,{"julian","1582-10-04"}),
			  "tool=cjdn format=txt type=convert calendar=julian\n"
			  "input.text=1582-10-04\n"
			  "data.cjdn=2299160\n"
			  "data.weekday=4 (Thursday)\n"
			  "calendar\tdate\n"
			  "gregorian\t1582-10-14\n"
			  "milankovic\t1582-10-13\n"
			  "julian\t1582-10-04\n");
}

TEST_F(CliTest,ConvertTargetsSubset){
	std::string out=run(cmd_conv,{"gregorian","2800-02-29","--to",
								  "milankovic,julian,milankovic","--format",
								  "json","--pretty","0"});
	EXPECT_NE(out.find("\"dates\":{\"milankovic\":\"2800-03-01\","
					   "\"julian\":\"2800-02-10\"}"),
			  std::string::npos);
	EXPECT_NE(out.find("\"weekday_name\":\"Tuesday\""),std::string::npos);
}

TEST_F(CliTest,DowForms){
	EXPECT_EQ(run(cmd_dow,{"2451547"}),
			  "tool=cjdn format=txt type=dow calendar=gregorian\n"
			  "data.cjdn=2451547\n"
			  "data.weekday=1\n"
			  "data.name=Monday\n");
	EXPECT_NE(run(cmd_dow,{"-1"}).find("data.name=Sunday\n"),
			  std::string::npos);
	EXPECT_NE(run(cmd_dow,{"julian","1582-10-04"}).find("data.weekday=4\n"),
			  std::string::npos);
}

TEST_F(CliTest,OutFileReceivesOutput){
	std::string path=tmp("dow.json");
	EXPECT_EQ(run(cmd_dow,{"0","--format","json","--pretty","0","--out",path,
						   "--quiet"}),
			  "");
	EXPECT_EQ(slurp(path),
			  "{\"meta\":{\"tool\":\"cjdn\",\"version\":\"cjdn 1.0.0\","
			  "\"schema\":\"cjdn.v1\",\"type\":\"dow\",\"calendar\":"
			  "\"gregorian\"},\"data\":{\"cjdn\":0,\"weekday\":1,\"name\":"
			  "\"Monday\"}}\n");
}

TEST_F(CliTest,ConfigChangesDefaults){
	EXPECT_EQ(cmd_cfg({"set","def_cal","j","--quiet"}),0);
	EXPECT_EQ(cmd_cfg({"set","def_fmt","CSV","--quiet"}),0);
	EXPECT_EQ(load_def().def_cal,"julian");
	EXPECT_EQ(run(cmd_from,{"0"}),
			  "calendar,cjdn,part,result,weekday\n"
			  "julian,0,date,-4712-01-01,1\n");
	// dow has no csv output and falls back to txt.
	EXPECT_EQ(run(cmd_dow,{"0"}).rfind("tool=cjdn format=txt",0),0u);
}

TEST_F(CliTest,ConfigShowAndValidation){
	EXPECT_EQ(cmd_cfg({"set","strict","1","--quiet"}),0);
	EXPECT_EQ(run(cmd_cfg,{"show"}),
			  "tool=cjdn format=txt type=config\n"
			  "def_cal=gregorian\n"
			  "def_fmt=txt\n"
			  "def_prety=1\n"
			  "strict=1\n");
	EXPECT_THROW(cmd_to({"1900-02-29"}),std::out_of_range);
	EXPECT_THROW(cmd_cfg({"set","def_fmt","xml"}),std::invalid_argument);
	EXPECT_THROW(cmd_cfg({"set","colour","red"}),std::invalid_argument);
	EXPECT_THROW(cmd_cfg({"set","def_cal","hebrew"}),std::invalid_argument);
	EXPECT_THROW(cmd_cfg({"drop"}),std::invalid_argument);
}

TEST_F(CliTest,BadConfigValuesFallBack){
	{
		std::ofstream ofs(cfg_);
		ofs<<"def_cal = nowhere\ndef_fmt=yaml\nunknown=1\n";
	}
	InterCfg cfg=load_def();
	EXPECT_EQ(cfg.def_cal,"gregorian");
	EXPECT_EQ(cfg.def_fmt,"txt");
	EXPECT_TRUE(cfg.def_prety);
	EXPECT_FALSE(cfg.strict);
}

TEST_F(CliTest,ParseCalendarList){
	std::vector<CalKind> cals=parse_cals("g, julian ,g");
	ASSERT_EQ(cals.size(),2u);
	EXPECT_EQ(cals[0],CalKind::gregorian);
	EXPECT_EQ(cals[1],CalKind::julian);
	EXPECT_THROW(parse_cals("g,,j"),std::invalid_argument);
	EXPECT_THROW(parse_cals(""),std::invalid_argument);
}

TEST_F(CliTest,Dispatcher){
	EXPECT_EQ(run(run_cli_args,{"--version"}),"cjdn 1.0.0\n");
	EXPECT_NE(run(run_cli_args,{"to","j","1","1","1"}).find("data.cjdn=1721424"),
			  std::string::npos);
	EXPECT_THROW(run_cli_args({"bogus"}),std::invalid_argument);
	EXPECT_NE(run(run_cli_args,{"--help"}).find("cjdn selftest"),
			  std::string::npos);
}

TEST_F(CliTest,Completion){
	EXPECT_NE(run(cmd_comp,{"bash"}).find("complete -F _cjdn_complete cjdn"),
			  std::string::npos);
	EXPECT_NE(run(cmd_comp,{"fish"}).find("complete -c cjdn"),
			  std::string::npos);
	EXPECT_THROW(cmd_comp({"tcsh"}),std::invalid_argument);
}

TEST_F(CliTest,SelftestPasses){
	std::string out=run(cmd_test,{"--format","json","--pretty","0","--quiet"});
	EXPECT_NE(out.find("\"type\":\"selftest\""),std::string::npos);
	EXPECT_NE(out.find("\"data\":{\"pass\":true"),std::string::npos);
	EXPECT_EQ(out.find("\"pass\":false"),std::string::npos) << out;
}

TEST_F(CliTest,FromRejectsDayNumberOutsideRange){
	EXPECT_THROW(cmd_from({"gregorian","9223372036854775807"}),
				 std::out_of_range);
	EXPECT_THROW(cmd_from({"julian","-1000000000000000001"}),
				 std::out_of_range);
	EXPECT_NE(run(cmd_from,{"julian","1000000000000000000"})
				  .find("data.date=2737850787127389-04-20\n"),
			  std::string::npos);
	EXPECT_THROW(cmd_to({"gregorian","9223372036854775807","1","1"}),
				 std::out_of_range);
}

TEST_F(CliTest,FromBatchMarksOutOfRangeLine){
	std::string in=tmp("in.txt","9223372036854775807\n0\n");
	std::string out=run(cmd_from,{"gregorian","--file",in,"--format","csv",
								  "--quiet"},
						1);
	EXPECT_NE(out.find("1,error,9223372036854775807,,,,CJDN out of range: "
					   "9223372036854775807 (limit +-1000000000000000000)\n"),
			  std::string::npos);
	EXPECT_NE(out.find("2,ok,0,0,-4713-11-24,1,\n"),std::string::npos);
}

TEST_F(CliTest,DowDateRolloverIsNoted){
	CerrCap err;
	std::string out=run(cmd_dow,{"gregorian","1900-02-29"});
	EXPECT_NE(out.find("data.cjdn=2415080\n"),std::string::npos);
	EXPECT_EQ(err.str(),"note: 1900-02-29 is not a valid gregorian date, "
						"computed as 1900-03-01\n");
}

TEST_F(CliTest,DowDateQuietSuppressesNote){
	CerrCap err;
	run(cmd_dow,{"gregorian","1900-02-29","--quiet"});
	run(cmd_dow,{"julian","1900-02-29"});
	EXPECT_EQ(err.str(),"");
}

TEST_F(CliTest,DowCalendarWithDayNumber){
	EXPECT_EQ(run(cmd_dow,{"julian","2451547"}),
			  "tool=cjdn format=txt type=dow calendar=julian\n"
			  "data.cjdn=2451547\n"
			  "data.weekday=1\n"
			  "data.name=Monday\n");
	EXPECT_NE(run(cmd_dow,{"m","-1"}).find("data.name=Sunday\n"),
			  std::string::npos);
	EXPECT_NE(run(cmd_dow,{"g","-4712-01-01"}).find("data.cjdn=38\n"),
			  std::string::npos);
	EXPECT_THROW(cmd_dow({"julian","24515x7"}),std::invalid_argument);
}
