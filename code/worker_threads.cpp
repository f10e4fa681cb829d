
#include "worker_threads.hpp"

#include <algorithm>
#include <iostream>
#include <latch>
#include <list>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "global.h"


// ----------------------------------- //
//         Implementation of           //
//      SweepThreadGroupManager        //
// ----------------------------------- //

SweepThreadGroupManager::SweepThreadGroupManager(std::vector<sensitivity::SweepCase>& cases)
{
    if (Global::get_n_threads() < 1)
        throw std::logic_error("Thread group manager cannot be started if the number of worker threads is set to 0.");

    // create as much lists as we have workers where we iteratively add one case
    const size_t n_workers = std::min<size_t>(Global::get_n_threads(), cases.size());
    std::vector<std::list<sensitivity::SweepCase*>> vlc(n_workers);
    // add cases to the lists iteratively
    size_t t = 0; // the current worker where the next case will be attached to
    for (sensitivity::SweepCase& sc : cases) {
        vlc[t].push_back(&sc);
        // increment t
        t++;
        if (t >= n_workers)
            t = 0;
    }

    // Initialize the worker threads
    worker_threads.reserve(n_workers);
    for (size_t w = 0; w < n_workers; w++) {
        worker_threads.push_back( std::make_unique<SweepWorkerThread>(vlc[w], *this) );
    }
}

SweepThreadGroupManager::~SweepThreadGroupManager() {
    // the workers are stopped and joined by their destructors
    worker_threads.clear();
}

void SweepThreadGroupManager::startAllWorkerThreads() {
    for (auto& wt : worker_threads) {
        wt->start();
    }
}

void SweepThreadGroupManager::stopAllWorkerThreads() {
    for (auto& wt : worker_threads) {
        wt->stop();
    }
}

void SweepThreadGroupManager::executeAllCases() {
    // (Re-)Initialize the latch object
    all_workers_finished_latch = std::make_unique<std::latch>( static_cast<std::ptrdiff_t>(worker_threads.size()) );
    // Notify all threads to start working
    for (auto& wt : worker_threads) {
        wt->executeAllConnCases();
    }
}

bool SweepThreadGroupManager::waitForWorkersToFinish() {
    if (all_workers_finished_latch)
        all_workers_finished_latch->wait();
    //
    // return false, if an error occured
    bool ok = true;
    for (auto& wt : worker_threads) {
        if (wt->errorHappened())
            ok = false;
    }
    return ok;
}



// ----------------------------- //
//      Implementation of        //
//      SweepWorkerThread        //
// ----------------------------- //
SweepWorkerThread::SweepWorkerThread(
    const std::list<sensitivity::SweepCase*>& connected_cases_,
    SweepThreadGroupManager& caller
) : thread_group_manager(caller),
    connected_cases(connected_cases_.begin(), connected_cases_.end())
{
    atomic_flag_stop    = false;
    atomic_flag_exec    = false;
    atomic_flag_running = false;
    atomic_flag_idling  = true;

    error_happened      = false;
}

SweepWorkerThread::~SweepWorkerThread() {
    // Stop the thread and clean up
    stop();
    // Join the threads and set the flags to false
    if (current_thread.joinable()) {
        current_thread.join();
    }
    {
        std::unique_lock<std::mutex> lock_obj(mtx);
        atomic_flag_running = false;
    }
}

void SweepWorkerThread::start() {
    // Is the thread already started?
    bool start_thread = false;
    {
        std::unique_lock<std::mutex> lock_obj(mtx);
        if (!atomic_flag_running) {
            start_thread = true;
            atomic_flag_running = true;
        }
    }
    // Start the thread, if it is not already running
    if (start_thread) {
        current_thread = std::thread(&SweepWorkerThread::run, this);
    }
}

void SweepWorkerThread::stop() {
    {
        // lock the mutex in this scope
        std::unique_lock<std::mutex> lock_obj(mtx);
        // do the atomic operation
        atomic_flag_stop = true;
    }
    cv.notify_all();
}

void SweepWorkerThread::executeAllConnCases()
{
    {
        // lock the mutex in this scope
        std::unique_lock<std::mutex> lock_obj(mtx);
        // set the flag
        atomic_flag_exec   = true;
        atomic_flag_idling = false;
    }
    cv.notify_all();
}

void SweepWorkerThread::run() {
    bool exec_task = false; // thread-internal variable to store the value of atomic_flag_exec
    //
    while (true)
    {
        {
            // lock the mutex
            std::unique_lock<std::mutex> lock_obj(mtx);
            // wait for the variables to change ( the wait-method relases the mutex until the condition is met, otherwise other thrads could not aquire a lock in the executeAllConnCases()-method )
            cv.wait(lock_obj, [this] { return atomic_flag_stop || atomic_flag_exec; });

            // execute the main task if it is selected
            if (atomic_flag_exec) {
                exec_task = true;
                atomic_flag_exec = false;
            }

            // return if stop flag has been set and no task is pending
            if (atomic_flag_stop && !exec_task) {
                atomic_flag_stop = false;
                return;
            }
        }
        // run all connected cases outside of the locked mutex
        if (exec_task) {
            exec_task = false; // do not execute it again
            for (sensitivity::SweepCase* sc : connected_cases) {
                sensitivity::run_case(*sc);
                if (!sc->result.has_value())
                    error_happened = true;
            }
            // set atomic flag for idling to true AFTER the task has been executed
            {
                std::unique_lock<std::mutex> lock_obj(mtx);
                atomic_flag_idling = true;
            }
            // decrement the latch
            thread_group_manager.all_workers_finished_latch->count_down();
        }
    }
}
