#include "cjdn/entry.hpp"

#include<iostream>
#include<stdexcept>
#include<string>
#include<vector>

#include "cjdn/cli.hpp"
#include "cjdn/interact.hpp"

int run_cli_args(const std::vector<std::string>&args){
	if(args.empty()){
		int_mode();
		return 0;
	}

	const std::string&first=args[0];
	std::vector<std::string> rest(args.begin()+1,args.end());

	if(first=="-h"||first=="--help"){
		use_main();
		return 0;
	}
	if(first=="--version"){
		std::cout<<tool_ver()<<std::endl;
		return 0;
	}

	if(first=="to"){
		return cmd_to(rest);
	}
	if(first=="from"){
		return cmd_from(rest);
	}
	if(first=="convert"){
		return cmd_conv(rest);
	}
	if(first=="dow"){
		return cmd_dow(rest);
	}
	if(first=="selftest"){
		return cmd_test(rest);
	}
	if(first=="config"){
		return cmd_cfg(rest);
	}
	if(first=="completion"){
		return cmd_comp(rest);
	}

	throw std::invalid_argument("unknown command: "+first+
								" (see cjdn --help)");
}
