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
	@brief Main library include file
 */

#ifndef lidata_h
#define lidata_h

#include <algorithm>
#include <deque>
#include <list>
#include <vector>
#include <string>
#include <map>
#include <stdint.h>
#include <inttypes.h>
#include <stdio.h>
#include <stdarg.h>
#include <stdlib.h>
#include <time.h>
#include <chrono>
#include <thread>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <iterator>
#include <climits>
#include <float.h>
#include <math.h>
#include <string.h>
#include <ctype.h>
#include <errno.h>

#include <sigc++/sigc++.h>

#include <yaml-cpp/yaml.h>

#include <log/log.h>

#include "LIDataException.h"
#include "RecordValue.h"

#include "BinaryLayout.h"
#include "ProcessingExpression.h"
#include "BitstreamDecoder.h"
#include "RecordProcessor.h"

#include "FormatTemplate.h"
#include "CSVRenderer.h"
#include "LIDataParser.h"

#include "CaptureConfig.h"
#include "LIFileHeader.h"
#include "LIFileWriter.h"
#include "LIFileReader.h"

#include "StreamFrame.h"
#include "StreamFrameQueue.h"
#include "StreamFrameAssembler.h"

std::string Trim(const std::string& str);
std::vector<std::string> split(const std::string& str, char separator);
std::string to_string_hex(uint64_t n, bool zeropad = false, int len = 0);
std::string to_string_shortest(double d);
std::string string_printf(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

uint16_t ReadLE16(const uint8_t* p);
uint32_t ReadLE32(const uint8_t* p);
uint64_t ReadLE64(const uint8_t* p);
void AppendLE16(std::vector<uint8_t>& buf, uint16_t v);
void AppendLE32(std::vector<uint8_t>& buf, uint32_t v);
void AppendLE64(std::vector<uint8_t>& buf, uint64_t v);

#endif
