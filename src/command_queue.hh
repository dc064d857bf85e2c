/*
 * Copyright (C) 2024  T+A elektroakustik GmbH & Co. KG
 *
 * This file is part of Rosesong.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * as published by the Free Software Foundation; either version 2
 * of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA  02110-1301, USA.
 */

#ifndef COMMAND_QUEUE_HH
#define COMMAND_QUEUE_HH

#include <deque>
#include <memory>

#include "command.hh"
#include "logged_lock.hh"
#include "messages.h"

namespace Player
{

/*!
 * Ordered channel from command producers to the dispatcher.
 *
 * External commands are limited in number, internal commands are always
 * accepted. Commands are taken in the order they have been posted.
 */
class CommandQueue
{
  public:
    enum class PostResult
    {
        OK,
        FULL,
        SHUT_DOWN,
    };

  private:
    LoggedLock::Mutex lock_;
    LoggedLock::ConditionVariable cv_;

    std::deque<std::unique_ptr<Command>> queue_;
    const size_t max_external_;
    size_t external_count_;
    bool is_shut_down_;

  public:
    CommandQueue(const CommandQueue &) = delete;
    CommandQueue &operator=(const CommandQueue &) = delete;

    explicit CommandQueue(size_t max_external):
        max_external_(max_external > 0 ? max_external : 1),
        external_count_(0),
        is_shut_down_(false)
    {
        LoggedLock::configure(lock_, "CommandQueue", MESSAGE_LEVEL_DEBUG);
    }

    /*!
     * Enqueue external command.
     *
     * \param command
     *     The command to enqueue. It is moved into the queue on success, and
     *     left untouched on failure.
     */
    PostResult post(std::unique_ptr<Command> &command)
    {
        msg_log_assert(command != nullptr);

        {
            LoggedLock::UniqueLock<LoggedLock::Mutex> lock(lock_);

            if(is_shut_down_)
                return PostResult::SHUT_DOWN;

            if(!command->is_internal())
            {
                if(external_count_ >= max_external_)
                    return PostResult::FULL;

                ++external_count_;
            }

            queue_.emplace_back(std::move(command));
        }

        cv_.notify_one();

        return PostResult::OK;
    }

    /*!
     * Enqueue internal command, never fails unless the queue is shut down.
     */
    void post_internal(std::unique_ptr<Command> command)
    {
        msg_log_assert(command != nullptr);
        msg_log_assert(command->is_internal());

        if(post(command) != PostResult::OK)
            msg_vinfo(MESSAGE_LEVEL_DIAG,
                      "Dropped command %s after shutdown",
                      command_to_string(command->id_));
    }

    /*!
     * Wait for next command.
     *
     * \returns
     *     The next command, or \c nullptr after #Player::CommandQueue::shutdown()
     *     has been called.
     */
    std::unique_ptr<Command> take()
    {
        LoggedLock::UniqueLock<LoggedLock::Mutex> lock(lock_);

        cv_.wait(lock, [this] { return is_shut_down_ || !queue_.empty(); });

        if(is_shut_down_)
            return nullptr;

        std::unique_ptr<Command> result = std::move(queue_.front());
        queue_.pop_front();

        if(!result->is_internal())
            --external_count_;

        return result;
    }

    /*!
     * Wake up consumer and reject all further commands.
     *
     * Pending commands are discarded.
     */
    void shutdown()
    {
        std::deque<std::unique_ptr<Command>> discarded;

        {
            LoggedLock::UniqueLock<LoggedLock::Mutex> lock(lock_);
            is_shut_down_ = true;
            discarded.swap(queue_);
            external_count_ = 0;
        }

        cv_.notify_all();

        if(!discarded.empty())
            msg_vinfo(MESSAGE_LEVEL_DIAG, "Discarded %zu pending commands",
                      discarded.size());
    }

    size_t size()
    {
        LoggedLock::UniqueLock<LoggedLock::Mutex> lock(lock_);
        return queue_.size();
    }
};

}

#endif /* !COMMAND_QUEUE_HH */
