/* logs.h                                                          -*- C++ -*-
   Eric Robert, 9 October 2013
   Copyright (c) 2013 Datacratic.  All rights reserved.
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   Log categories and the writers they print through.
*/

#pragma once

#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "coderun/types/date.h"

namespace Coderun {

/** Messages are written to a category, which is enabled or not and hands
    them to its writer.  Categories form a tree under the root category "*";
    activating one or redirecting it to another writer applies to its
    descendants.
*/

struct Logging
{
    /** Where the messages end up.  Called with the logging lock held, one
        call per message. */
    struct Writer {
        virtual ~Writer() {
        }

        virtual void write(Date const & timestamp,
                           char const * category,
                           char const * function,
                           char const * file,
                           int line,
                           std::string const & text) = 0;
    };

    /** Human readable lines on stderr. */
    struct ConsoleWriter : public Writer {
        ConsoleWriter(bool color = true) :
            color(color) {
        }

        void write(Date const & timestamp, char const * category,
                   char const * function, char const * file, int line,
                   std::string const & text);

    private:
        bool color;
    };

    /** One JSON object per line on stderr, with the time, category,
        function, file, line and text of the message. */
    struct JsonWriter : public Writer {
        void write(Date const & timestamp, char const * category,
                   char const * function, char const * file, int line,
                   std::string const & text);
    };

    struct Printer;
    struct Thrower;

    struct Category {
        /** A category under the root one. */
        explicit Category(char const * name, bool enabled = true);
        Category(char const * name, Category & parent, bool enabled = true);
        ~Category();

        Category(const Category&) = delete;
        Category& operator=(const Category&) = delete;

        char const * name() const { return name_.c_str(); }

        bool isDisabled() const { return !enabled_; }

        void activate(bool recurse = true);
        void writeTo(std::shared_ptr<Writer> writer, bool recurse = true);

        std::ostream & beginWrite(char const * function, char const * file,
                                  int line);

        static Category& root();

        /** Redirect every category to a writer for the given format,
            "console" or "json".  Throws on an unknown format. */
        static void writeAllTo(std::string const & format);

    private:
        friend struct Printer;
        friend struct Thrower;

        Category();

        void attach(Category * parent);
        std::vector<Category *> subtree(bool recurse);
        std::string endWrite();

        std::string name_;
        bool enabled_;
        std::shared_ptr<Writer> writer_;
        Category * parent_;
        std::vector<Category *> children_;

        /* Message being written, and where it was written from. */
        std::ostringstream stream_;
        Date timestamp_;
        char const * function_;
        char const * file_;
        int line_;
    };

    struct Printer {
        Printer(Category & category) : category(category) {
        }

        void operator&(std::ostream & stream);

    private:
        Category & category;
    };

    /** Writes the message like a Printer when the category is enabled,
        then throws it as a Coderun::Exception. */
    struct Thrower {
        Thrower(Category & category) : category(category) {
        }

        void operator&(std::ostream & stream) __attribute__((noreturn));

    private:
        Category & category;
    };
};

} // namespace Coderun

#define LOG(group, ...) \
    group.isDisabled() ? (void) 0 : Logging::Printer(group) & \
    group.beginWrite(__PRETTY_FUNCTION__, __FILE__, __LINE__ __VA_ARGS__)

#define THROW(group, ...) \
    Logging::Thrower(group) & \
    group.beginWrite(__PRETTY_FUNCTION__, __FILE__, __LINE__ __VA_ARGS__)
