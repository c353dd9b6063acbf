/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef OutputRelay_H_
#define OutputRelay_H_
// -------------------------------------------------------------------------
#include <memory>
#include <string>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <Poco/Pipe.h>
#include "Debug.h"
// -------------------------------------------------------------------------
namespace devvisor
{
    /*!
     * Output relay - copies the combined stdout/stderr of one child to the log,
     * line by line, as "[date time] [service] line".
     * Runs in its own thread until end of stream. Trailing whitespace is removed,
     * empty lines are skipped.
     * Must be owned by std::shared_ptr (the thread holds a reference until end of stream).
     */
    class OutputRelay:
        public std::enable_shared_from_this<OutputRelay>
    {
        public:
            OutputRelay( const std::string& serviceName, const Poco::Pipe& pipe, std::shared_ptr<DebugStream> log );
            ~OutputRelay();

            void start();

            //! true when the stream has ended
            bool finished() const;

            /*! Wait for the end of stream.
             * \return false if the stream did not end in time (a grandchild still holds the stream open)
             */
            bool waitFinished( size_t timeout_msec );

            size_t lines() const;

            std::string getServiceName() const;

        private:
            void run();

            std::string name_;
            Poco::Pipe pipe_;
            std::shared_ptr<DebugStream> mylog;

            std::thread thr_;
            std::atomic<bool> finished_{false};
            std::atomic<size_t> lines_{0};
            mutable std::mutex mut_;
            std::condition_variable cv_;
    };

} // end of namespace devvisor
// -------------------------------------------------------------------------
#endif // OutputRelay_H_
// -------------------------------------------------------------------------
