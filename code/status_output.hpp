/*
 * status_output.hpp
 *
 * Progress output of a run, either as single status line
 * on stdout or as ncurses screen.
 *
 */

#ifndef STATUS_OUTPUT_HPP
#define STATUS_OUTPUT_HPP

#include <atomic>
#include <mutex>
#include <ncurses.h>
#include <string>
#include <thread>
#include <vector>

/**
 * @class StatusOutput
 * @brief Thread-safe progress reporting of a run.
 *
 * If ncurses is initialized, the terminal is divided into two panes:
 * - Top: Errors reported by the cases of a sensitivity analysis.
 * - Bottom: Current status, updated once per second.
 *
 * Without ncurses the status is written as a single line to stdout.
 * In both cases the status is also written to /tmp/dercost-status.txt.
 */
class StatusOutput {
    public:
        /**
         * @brief Reports an error message.
         *
         * The message goes to the error pane, if ncurses is initialized, otherwise to stderr.
         */
        static void report_error(const std::string& error);

        /**
         * @brief Initializes the ncurses interface.
         *
         * This must be called before the status updater thread is started.
         */
        static void initialize_ncurses();

        /**
         * @brief Shuts down the ncurses interface and restores the terminal state.
         */
        static void shutdown_ncurses();

        static bool is_ncurses_initialized() { return ncurses_initialized; }
        static bool is_updater_running() { return running; }

        /**
         * @brief Starts the background thread that periodically updates the status.
         */
        static void start_status_updater_thread();

        /**
         * @brief Stops the background status updater thread.
         */
        static void stop_status_updater_thread();

        /**
         * @brief Returns the current status line, e.g. "Time since run start = 4s - Solved windows = 12"
         */
        static std::string build_status_line();

    private:
        static void update_windows();
        static void status_updater();

        static std::mutex error_mutex;
        static std::mutex status_mutex;

        static std::vector<std::string> error_messages;
        static std::string current_status;

        static std::atomic<bool> running;
        static std::atomic<bool> ncurses_initialized;
        static std::thread updater_thread;

        static WINDOW* error_win;
        static WINDOW* status_win;
};

#endif // STATUS_OUTPUT_HPP
