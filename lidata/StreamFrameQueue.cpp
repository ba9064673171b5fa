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
	@brief Implementation of StreamFrameQueue
 */

#include "lidata.h"

using namespace std;

void StreamFrameQueue::Push(const StreamFrame& frame)
{
	{
		lock_guard<mutex> lock(m_mutex);
		m_frames.push_back(frame);
	}
	m_frameCvar.notify_one();
}

optional<StreamFrame> StreamFrameQueue::TryPop()
{
	lock_guard<mutex> lock(m_mutex);
	if(m_frames.empty())
		return nullopt;

	auto ret = m_frames.front();
	m_frames.pop_front();
	return ret;
}

/**
	@brief Waits for a frame

	@param timeoutMs	Maximum time to wait, in milliseconds

	@return The oldest frame, or nothing if none arrived in time
 */
optional<StreamFrame> StreamFrameQueue::Pop(unsigned int timeoutMs)
{
	unique_lock<mutex> lock(m_mutex);
	if(!m_frameCvar.wait_for(lock, chrono::milliseconds(timeoutMs), [this]{return !m_frames.empty();}))
		return nullopt;

	auto ret = m_frames.front();
	m_frames.pop_front();
	return ret;
}

///@brief Discards any frames that haven't been processed yet
void StreamFrameQueue::Clear()
{
	lock_guard<mutex> lock(m_mutex);
	m_frames.clear();
}

size_t StreamFrameQueue::size()
{
	lock_guard<mutex> lock(m_mutex);
	return m_frames.size();
}
