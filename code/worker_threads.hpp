/*
 * worker_threads.hpp
 *
 * It contains the definition of classes required for
 * the worker threads of a sensitivity analysis.
 *
 */

#ifndef WORKER_THREADS_HPP
#define WORKER_THREADS_HPP

#include <atomic>
#include <condition_variable>
#include <latch>
#include <list>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

// The following classes are defined in this header file:
class SweepThreadGroupManager;
class SweepWorkerThread;

#include "global.h"
#include "sensitivity_analysis.h"

/*!
 * This class represents one group of threads of the class SweepWorkerThread.
 * It provides functionality for creating and managing all existing thread instances.
 * Every case of the sensitivity analysis is owned by exactly one worker.
 *
 * This class is not thread-safe.
 */
class SweepThreadGroupManager {
    private:
        friend class SweepWorkerThread;

    public:
        /*!
         * This function initializes the a new instance of the thread group manager.
         * It distributes the cases round-robin to Global::get_n_threads() workers.
         * Workers without any case are not created.
         *
         * @param cases: The cases to run. The vector must not be resized as long as the manager exists.
         */
        SweepThreadGroupManager(std::vector<sensitivity::SweepCase>& cases);

        ~SweepThreadGroupManager();

        /*!
         * This function starts all worker threads.
         * This means that the threads are forked and start to idle and with for tasks.
         * If called multiple times, it does not do anything.
         */
        void startAllWorkerThreads();

        /*!
         * This function stops all worker threads.
         * It stops all threads and joins them again.
         * If called multiple times, it does not do anything.
         */
        void stopAllWorkerThreads();

        /*!
         * This method notifies the worker threads to start working,
         * i.e., every worker runs all of its cases one after another.
         */
        void executeAllCases();

        /*!
         * This function waits until all workers are finished with executed their task,
         * that has been started with executeAllCases().
         *
         * @return false, if at least one case of a worker failed
         */
        bool waitForWorkersToFinish();

        size_t get_n_workers() const { return worker_threads.size(); }

    private:
        std::vector<std::unique_ptr<SweepWorkerThread>> worker_threads; ///< Vector of worker threads
        std::unique_ptr<std::latch> all_workers_finished_latch;
};

/*!
 * This class represents a working thread that runs a list of cases
 * of the sensitivity analysis on request.
 * The thread sleeps until it is activated using the public method
 * executeAllConnCases().
 */
class SweepWorkerThread {
    public:
        /*!
         * Constructs a new working thread for a list of cases.
         * Attention: A case MUST ONLY be connected to ONE working thread!
         *
         * @param connected_cases_: The list of cases that are connected to this working thread
         * @param caller: The reference to the thread group manager object
         */
        SweepWorkerThread(const std::list<sensitivity::SweepCase*>& connected_cases_, SweepThreadGroupManager& caller);
        ~SweepWorkerThread();
        void start(); ///< Starts this thread. This method has to be called before the call of executeAllConnCases().
        void stop(); ///< Stops this working thread.

        /*!
         * This method notifies the thread to start working.
         * Basically, it sets atomic_flag_exec to true.
         */
        void executeAllConnCases();

        /*!
         * This function returns true if the thread is idling, i.e., it is running, but not currently working and has also no planned work.
         */
        bool isIdling() const { return atomic_flag_idling; }

        /*!
         * Returns true, if at least one of the connected cases failed
         */
        bool errorHappened() const { return error_happened; }

    private:
        SweepThreadGroupManager& thread_group_manager; ///< Internal reference to the thread group manager
        std::vector<sensitivity::SweepCase*> connected_cases; ///< List of connected cases
        std::thread current_thread;
        std::mutex mtx; ///< The mutex object per instance
        std::condition_variable cv; ///< The conditional variable to signal the requests for running, i.e., by calling executeAllConnCases()
        std::atomic<bool> atomic_flag_stop;    ///< Set to true if the the working thread should stop
        std::atomic<bool> atomic_flag_exec;    ///< Set to true if the main action of this worker should be executed
        std::atomic<bool> atomic_flag_running; ///< Set to true if the thread is invoked and running (working or idling)
        std::atomic<bool> atomic_flag_idling;  ///< Set to true if the thread is idling (i.e., running but without work and without planned work)
        std::atomic<bool> error_happened;      ///< Set to true if a case failed
        //
        void run(); ///< Main internal function for this thread. It is started and stopped with the start()- and stop()-method.
};

#endif
