/***********************************************************************************************************************
*                                                                                                                      *
* liblidata v0.1                                                                                                       *
*                                                                                                                      *
* Copyright (c) 2012-2022 Andrew D. Zonenberg and contributors                                                         *
* All rights reserved.                                                                                                 *
*                                                                                                                      *
* Redistribution and use in source and binary forms, with or without modification, are permitted provided that the     *
* following conditions are met:                                                                                        *
*                                                                                                                      *
*    * Redistributions of source code must retain the above copyright notice, this list of conditions, and the         *
*      following disclaimer.                                                                                           *
*                                                                                                                      *
*    * Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the       *
*      following disclaimer in the documentation and/or other materials provided with the distribution.                *
*                                                                                                                      *
*    * Neither the name of the author nor the names of any contributors may be used to endorse or promote products     *
*      derived from this software without specific prior written permission.                                           *
*                                                                                                                      *
* THIS SOFTWARE IS PROVIDED BY THE AUTHORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED   *
* TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL *
* THE AUTHORS BE HELD LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES        *
* (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR       *
* BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT *
* (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE       *
* POSSIBILITY OF SUCH DAMAGE.                                                                                          *
*                                                                                                                      *
***********************************************************************************************************************/

/**
	@file
	@author Andrew D. Zonenberg
	@brief Command line converter from LI capture files to CSV
 */

#include "lidata.h"

using namespace std;

void ShowUsage();

int main(int argc, char* argv[])
{
	Severity console_verbosity = Severity::NOTICE;

	//Parse command-line arguments
	bool info = false;
	vector<string> paths;
	for(int i=1; i<argc; i++)
	{
		string s(argv[i]);

		//Let the logger eat its args first
		if(ParseLoggerArguments(i, argc, argv, console_verbosity))
			continue;

		if(s == "--info")
			info = true;
		else if( (s == "--help") || (s == "-h") )
		{
			ShowUsage();
			return 0;
		}
		else if(s[0] == '-')
		{
			fprintf(stderr, "Unrecognized argument \"%s\"\n", s.c_str());
			ShowUsage();
			return 1;
		}
		else
			paths.push_back(s);
	}

	//Set up logging
	g_log_sinks.emplace(g_log_sinks.begin(), new ColoredSTDLogSink(console_verbosity));

	if( (paths.size() != 2) && !(info && (paths.size() == 1)) )
	{
		ShowUsage();
		return 1;
	}

	try
	{
		LIFileReader reader;
		if(!reader.Open(paths[0]))
			return 1;

		if(info)
		{
			YAML::Emitter out;
			out << reader.GetHeader().SerializeConfiguration();
			printf("%s\n", out.c_str());
		}

		if(paths.size() == 2)
		{
			LogNotice("Converting %s to %s\n", paths[0].c_str(), paths[1].c_str());
			if(!reader.ToCSV(paths[1]))
				return 1;
		}
	}
	catch(const LIDataException& ex)
	{
		LogError("%s\n", ex.what());
		return 1;
	}

	return 0;
}

void ShowUsage()
{
	fprintf(stderr,
		"Usage: li2csv [logger args] [--info] in.li [out.csv]\n"
		"\n"
		"    --info     Print the capture configuration stored in the file header as YAML\n"
		"    --debug    Verbose log output\n");
}
