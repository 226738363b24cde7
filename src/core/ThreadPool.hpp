#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "common.hpp"


namespace blockreader
{
/**
 * Function evaluations can be given to a ThreadPool instance,
 * which assigns the evaluation to one of its threads to be evaluated in parallel.
 * Threads are spawned lazily up to the given thread count.
 */
class ThreadPool
{
private:
    /**
     * A small type-erasure function wrapper for non-copyable function objects with no function arguments.
     *
     * std::function<void()> won't work to wrap std::packaged_task
     * because the former requires a copy-constructible object, which the latter is not.
     * @see http://www.open-std.org/jtc1/sc22/wg21/docs/lwg-defects.html#1287
     */
    class PackagedTaskWrapper
    {
    private:
        struct BaseFunctor
        {
            virtual void
            operator()() = 0;

            virtual
            ~BaseFunctor() = default;
        };

        template<class T_Functor>
        struct SpecializedFunctor :
            BaseFunctor
        {
            explicit
            SpecializedFunctor( T_Functor&& functor ) :
                m_functor( std::move( functor ) )
            {}

            void
            operator()() override
            {
                m_functor();
            }

        private:
            T_Functor m_functor;
        };

    public:
        template<class T_Functor, std::enable_if_t<std::is_invocable_v<T_Functor>, void>* = nullptr>
        explicit
        PackagedTaskWrapper( T_Functor&& functor ) :
            m_impl( std::make_unique<SpecializedFunctor<T_Functor> >( std::forward<T_Functor>( functor ) ) )
        {}

        void
        operator()()
        {
            ( *m_impl )();
        }

    private:
        std::unique_ptr<BaseFunctor> m_impl;
    };

public:
    explicit
    ThreadPool( size_t threadCount = availableCores() ) :
        m_threadCount( threadCount )
    {
        m_threads.reserve( m_threadCount );
    }

    ~ThreadPool()
    {
        stop();
    }

    ThreadPool( const ThreadPool& ) = delete;

    ThreadPool&
    operator=( const ThreadPool& ) = delete;

    /**
     * Lets the worker threads finish their current task and joins them. Tasks that have not been started
     * yet are dropped, which makes their futures throw std::future_error with broken_promise.
     * Further submissions are rejected.
     */
    void
    stop()
    {
        {
            const std::lock_guard lock( m_mutex );
            m_threadPoolRunning = false;
            m_tasks.clear();
            m_pingWorkers.notify_all();
        }

        for ( auto& thread : m_threads ) {
            if ( thread.joinable() ) {
                thread.join();
            }
        }
        m_threads.clear();
    }

    /**
     * Any function taking no arguments and returning any argument may be submitted to be executed.
     * The returned future can be used to access the result when it is really needed.
     * Exceptions thrown by the task are stored in the future and rethrown on std::future::get.
     */
    template<class T_Functor, std::enable_if_t<std::is_invocable_v<T_Functor>, void>* = nullptr>
    std::future<decltype( std::declval<T_Functor>()() )>
    submit( T_Functor&& task )
    {
        const std::lock_guard lock( m_mutex );

        if ( !m_threadPoolRunning ) {
            throw std::logic_error( "Tasks may not be submitted to a stopped thread pool!" );
        }

        if ( m_threadCount == 0 ) {
            return std::async( std::launch::deferred, std::forward<T_Functor>( task ) );
        }

        /* Use a packaged task, which abstracts handling the return type and makes the task return void. */
        using ReturnType = decltype( std::declval<T_Functor>()() );
        std::packaged_task<ReturnType()> packagedTask{ std::forward<T_Functor>( task ) };
        auto resultFuture = packagedTask.get_future();
        m_tasks.emplace_back( std::move( packagedTask ) );

        if ( ( m_threads.size() < m_threadCount ) && ( m_idleThreadCount < m_tasks.size() ) ) {
            m_threads.emplace_back( [this] () { workerMain(); } );
        }

        m_pingWorkers.notify_one();

        return resultFuture;
    }

    [[nodiscard]] size_t
    capacity() const noexcept
    {
        return m_threadCount;
    }

    [[nodiscard]] size_t
    unprocessedTasksCount() const
    {
        const std::lock_guard lock( m_mutex );
        return m_tasks.size();
    }

    [[nodiscard]] bool
    running() const noexcept
    {
        return m_threadPoolRunning;
    }

private:
    void
    workerMain()
    {
        while ( m_threadPoolRunning )
        {
            std::unique_lock<std::mutex> tasksLock( m_mutex );
            ++m_idleThreadCount;
            m_pingWorkers.wait( tasksLock, [this] () { return !m_tasks.empty() || !m_threadPoolRunning; } );
            --m_idleThreadCount;

            if ( !m_threadPoolRunning ) {
                break;
            }

            auto task = std::move( m_tasks.front() );
            m_tasks.pop_front();
            tasksLock.unlock();
            task();
        }
    }

private:
    std::atomic<bool> m_threadPoolRunning = true;

    const size_t m_threadCount;
    size_t m_idleThreadCount{ 0 };

    /** Guards m_tasks, m_idleThreadCount, AND m_pingWorkers or else the notify_all might go unnoticed! */
    mutable std::mutex m_mutex;
    std::condition_variable m_pingWorkers;
    std::deque<PackagedTaskWrapper> m_tasks;

    /**
     * Should come last so that it's lifetime is the shortest, i.e., there is no danger for the other
     * members to not yet be constructed or be already destructed while a task is still running.
     */
    std::vector<std::thread> m_threads;
};
}  // namespace blockreader
