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
	@brief Declaration of LIDataException and its subclasses
 */

#ifndef LIDataException_h
#define LIDataException_h

#include <stdexcept>

/**
	@brief Base class for all errors raised while handling LI data
 */
class LIDataException : public std::runtime_error
{
public:
	explicit LIDataException(const std::string& what)
		: std::runtime_error(what)
	{}
};

/**
	@brief A binary layout, processing expression, or format template could not be parsed
 */
class FormatError : public LIDataException
{
public:
	explicit FormatError(const std::string& what)
		: LIDataException(what)
	{}
};

/**
	@brief An LI file is damaged (bad magic, header length mismatch, truncated chunk)
 */
class CorruptFileError : public LIDataException
{
public:
	explicit CorruptFileError(const std::string& what)
		: LIDataException(what)
	{}
};

/**
	@brief An LI file has a version byte we don't know how to parse
 */
class UnsupportedVersionError : public LIDataException
{
public:
	explicit UnsupportedVersionError(const std::string& what)
		: LIDataException(what)
	{}
};

/**
	@brief The instrument has signaled the end of a network data stream.

	This is a normal termination condition, not a failure.
 */
class StreamEndedException : public LIDataException
{
public:
	explicit StreamEndedException(const std::string& what)
		: LIDataException(what)
	{}
};

/**
	@brief No stream frame arrived within the requested time
 */
class StreamTimeoutException : public LIDataException
{
public:
	explicit StreamTimeoutException(const std::string& what)
		: LIDataException(what)
	{}
};

#endif
