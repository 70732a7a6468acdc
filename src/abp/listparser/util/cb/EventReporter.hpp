/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/


#pragma once

#include "ParserCallbackTypes.h"
#include <boost/utility/string_ref.hpp>
#include <string>
#include <thread>

namespace abp
{
	namespace listparser
	{
		namespace util
		{
			namespace cb
			{

				/// <summary>
				/// The EventReporter is a simple class meant to contain pointers to functions
				/// designed for various purposes, and providing a simply interface to access these
				/// functions. This class is simply included for convenience and to reduce code
				/// duplication, as more than one class in this library attempts to provide
				/// informational callbacks to users for handled events.
				/// 
				/// The methods for setting functions and invoke them are marked virtual to allow
				/// the possibility of implementations where these methods are given thread safety
				/// and such, while keeping this basic class basic and free of any such additional 
				/// overhead.
				/// </summary>
				class EventReporter
				{

				public:

					/// <summary>
					/// Constructs members with the given arguments. Nothing special here.
					/// </summary>
					/// <param name="onInfo">
					/// Callback for general information about non-critical events.
					/// </param>
					/// <param name="onWarning">
					/// Callback for warnings about potentially critical events.
					/// </param>
					/// <param name="onError">
					/// Callback for error information about critical events that were handled.
					/// </param>
					EventReporter(
						MessageFunction onInfo = nullptr,
						MessageFunction onWarning = nullptr,
						MessageFunction onError = nullptr
						) :
						m_onInfo(onInfo),
						m_onWarning(onWarning),
						m_onError(onError)
					{

					}

					/// <summary>
					/// Default destructor.
					/// </summary>
					virtual ~EventReporter()
					{

					}

					/// <summary>
					/// Sets the callback for general information about non-critical events.
					/// </summary>
					/// <param name="onInfo">
					/// Callback for general information about non-critical events.
					/// </param>
					virtual void SetOnInfo(MessageFunction onInfo)
					{
						m_onInfo = onInfo;
					}

					/// <summary>
					/// Sets the callback for warnings about potentially critical events.
					/// </summary>
					/// <param name="onWarning">
					/// Callback for warnings about potentially critical events.
					/// </param>
					virtual void SetOnWarning(MessageFunction onWarning)
					{
						m_onWarning = onWarning;
					}

					/// <summary>
					/// Sets the callback for error information about critical events that were handled.
					/// </summary>
					/// <param name="onError">
					/// Callback for error information about critical events that were handled.
					/// </param>
					virtual void SetOnError(MessageFunction onError)
					{
						m_onError = onError;
					}

					/// <summary>
					/// If the info callback member is valid, invokes it with the informational
					/// message data as arguments.
					/// </summary>
					/// <param name="infoMessage">
					/// An informational string about a non-critical event.
					/// </param>
					virtual void ReportInfo(const boost::string_ref infoMessage) const
					{
						Dispatch(m_onInfo, infoMessage);
					}

					/// <summary>
					/// If the warning callback member is valid, invokes it with the warning message
					/// data as arguments.
					/// </summary>
					/// <param name="warningMessage">
					/// An informational string about potentially critical event.
					/// </param>
					virtual void ReportWarning(const boost::string_ref warningMessage) const
					{
						Dispatch(m_onWarning, warningMessage);
					}

					/// <summary>
					/// If the error callback member is valid, invokes it with the error message
					/// data as arguments.
					/// </summary>
					/// <param name="errorMessage">
					/// An informational string about a critical event.
					/// </param>
					virtual void ReportError(const boost::string_ref errorMessage) const
					{
						Dispatch(m_onError, errorMessage);
					}

				protected:

					/// <summary>
					/// Invokes the supplied callback, if valid, with the supplied message. Debug
					/// builds prefix the message with a hash of the reporting thread's id, since
					/// lists may be parsed on several worker threads at once.
					/// </summary>
					static void Dispatch(const MessageFunction& callback, const boost::string_ref message)
					{
						if (!callback || message.data() == nullptr)
						{
							return;
						}

						#ifndef NDEBUG
							std::string m = u8"From Thread " + std::to_string(std::hash<std::thread::id>()(std::this_thread::get_id()));
							m.append(": ").append(message.to_string());
							callback(m.c_str(), m.size());
						#else
							callback(message.data(), message.size());
						#endif
					}

					/// <summary>
					/// Callback for general information about non-critical events.
					/// </summary>
					MessageFunction m_onInfo;

					/// <summary>
					/// Callback for warnings about potentially critical events.
					/// </summary>
					MessageFunction m_onWarning;

					/// <summary>
					/// Callback for error information about critical events that were handled.
					/// </summary>
					MessageFunction m_onError;

				};

			} /* namespace cb */
		} /* namespace util */
	} /* namespace listparser */
} /* namespace abp */
