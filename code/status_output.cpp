#include "status_output.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <string>

#include "global.h"

using namespace std;

// Define static members
std::mutex StatusOutput::error_mutex;
std::mutex StatusOutput::status_mutex;

std::vector<std::string> StatusOutput::error_messages;
std::string StatusOutput::current_status;

std::atomic<bool> StatusOutput::running{false};
std::atomic<bool> StatusOutput::ncurses_initialized{false};
std::thread StatusOutput::updater_thread;

WINDOW* StatusOutput::error_win = nullptr;
WINDOW* StatusOutput::status_win = nullptr;


void StatusOutput::initialize_ncurses() {
    if (!ncurses_initialized) {
        initscr();
        noecho();
        cbreak();
        refresh();

        int height, width;
        getmaxyx(stdscr, height, width);

        error_win  = newwin(height - 4, width, 0, 0);
        status_win = newwin(4, width, height - 4, 0);
        scrollok(error_win, TRUE);

        box(error_win, 0, 0);
        box(status_win, 0, 0);
        mvwprintw(error_win, 0, 2, " Errors ");

        wrefresh(error_win);
        wrefresh(status_win);

        ncurses_initialized = true;
    }
}

void StatusOutput::shutdown_ncurses() {
    if (ncurses_initialized) {
        delwin(error_win);
        delwin(status_win);
        error_win  = nullptr;
        status_win = nullptr;
        endwin();
        ncurses_initialized = false;
    }
}

void StatusOutput::report_error(const std::string& error) {
    std::lock_guard<std::mutex> lock(error_mutex);
    error_messages.push_back(error);
    if (!ncurses_initialized)
        cerr << error << endl;
}

string StatusOutput::build_status_line() {
    auto time_now  = std::chrono::system_clock::now();
    auto time_diff = std::chrono::duration_cast<std::chrono::seconds>(time_now - global::time_of_run_start).count();
    string status  = "Time since run start = ";
    status += to_string( time_diff );
    status += "s - Solved windows = ";
    status += to_string( global::n_windows_solved.load() );
    if (global::n_cases_total > 0) {
        status += " - Finished cases = ";
        status += to_string( global::n_cases_finished.load() );
        status += "/";
        status += to_string( global::n_cases_total.load() );
    }
    return status;
}

void StatusOutput::update_windows() {
    {
        std::lock_guard<std::mutex> lock(error_mutex);
        werase(error_win);
        box(error_win, 0, 0);
        mvwprintw(error_win, 0, 2, " Errors ");
        int height, width;
        getmaxyx(error_win, height, width);
        (void) width;
        // show the latest messages that fit into the pane
        const int n_rows  = height - 2;
        const size_t first = error_messages.size() > (size_t) n_rows ? error_messages.size() - n_rows : 0;
        int row = 1;
        for (size_t i = first; i < error_messages.size(); i++)
            mvwprintw(error_win, row++, 1, "%s", error_messages[i].c_str());
        wrefresh(error_win);
    }
    std::lock_guard<std::mutex> lock(status_mutex);
    werase(status_win);
    box(status_win, 0, 0);
    mvwprintw(status_win, 1, 1, "Status: %s", current_status.c_str());
    wrefresh(status_win);
}

void StatusOutput::status_updater() {
    while (running) {
        {
            std::lock_guard<std::mutex> lock(status_mutex);
            current_status = build_status_line();
            //
            ofstream ofs("/tmp/dercost-status.txt", std::ofstream::out);
            ofs << current_status << "\n";
            ofs.close();
        }
        if (ncurses_initialized) {
            update_windows();
        } else {
            // writing to stdout
            std::lock_guard<std::mutex> lock(status_mutex);
            std::cout << current_status << "\r" << std::flush;
        }
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
}

void StatusOutput::start_status_updater_thread() {
    if (!running) {
        running = true;
        updater_thread = std::thread(status_updater);
    }
}

void StatusOutput::stop_status_updater_thread() {
    if (running) {
        running = false;
        updater_thread.join();
    }
}
