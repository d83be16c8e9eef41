/* logs.cc
   Eric Robert, 9 October 2013
   Copyright (c) 2013 Datacratic.  All rights reserved.
   Copyright (c) 2026 The coderun authors.  All rights reserved.

*/

#include <unistd.h>

#include <algorithm>
#include <iostream>
#include <mutex>

#include "coderun/arch/exception.h"
#include "coderun/types/json.h"

#include "logs.h"

namespace Coderun {

namespace {

/* Held from beginWrite until the message has been handed to the writer, and
   while the tree of categories changes.  Several threads log concurrently
   (the message loops and the task queue workers). */
std::mutex & logLock()
{
    static std::mutex lock;
    return lock;
}

/* std::endl leaves a newline at the end of every message. */
std::string chomp(std::string text)
{
    if (!text.empty() && text[text.size() - 1] == '\n')
        text.resize(text.size() - 1);
    return text;
}

} // file scope


/*****************************************************************************/
/* WRITERS                                                                   */
/*****************************************************************************/

void
Logging::ConsoleWriter::
write(Date const & timestamp, char const * category,
      char const * function, char const * file, int line,
      std::string const & text)
{
    std::string output = timestamp.print(3) + " ";
    if (color) {
        output += std::string("\033[1;32m") + category + " \033[1;34m"
            + text + "\033[0m\n";
    }
    else {
        output += std::string(category) + " " + text + "\n";
    }
    std::cerr << output;
}

void
Logging::JsonWriter::
write(Date const & timestamp, char const * category,
      char const * function, char const * file, int line,
      std::string const & text)
{
    Json::Value record;
    record["time"] = timestamp.printIso8601();
    record["name"] = category;
    record["call"] = function;
    record["file"] = file;
    record["line"] = line;
    record["text"] = text;
    std::cerr << printJson(record) + "\n";
}


/*****************************************************************************/
/* CATEGORY                                                                  */
/*****************************************************************************/

Logging::Category::
Category()
    : name_("*"), enabled_(true),
      writer_(std::make_shared<ConsoleWriter>()),
      parent_(nullptr), function_(nullptr), file_(nullptr), line_(0)
{
}

Logging::Category::
Category(char const * name, bool enabled)
    : name_(name), enabled_(enabled),
      parent_(nullptr), function_(nullptr), file_(nullptr), line_(0)
{
    attach(&root());
}

Logging::Category::
Category(char const * name, Category & parent, bool enabled)
    : name_(name), enabled_(enabled),
      parent_(nullptr), function_(nullptr), file_(nullptr), line_(0)
{
    attach(&parent);
}

Logging::Category::
~Category()
{
    if (!parent_)
        return;

    /* The children outlive their parent only at exit, where they are left
       under the root. */
    Category & top = root();
    std::lock_guard<std::mutex> guard(logLock());
    auto & siblings = parent_->children_;
    siblings.erase(std::remove(siblings.begin(), siblings.end(), this),
                   siblings.end());
    for (Category * child: children_) {
        child->parent_ = &top;
        top.children_.push_back(child);
    }
}

void
Logging::Category::
attach(Category * parent)
{
    std::lock_guard<std::mutex> guard(logLock());
    parent_ = parent;
    parent_->children_.push_back(this);
    writer_ = parent_->writer_;
}

Logging::Category &
Logging::Category::
root()
{
    static Category root;
    return root;
}

std::vector<Logging::Category *>
Logging::Category::
subtree(bool recurse)
{
    std::vector<Category *> result(1, this);
    for (size_t i = 0; recurse && i < result.size(); i++) {
        const auto & children = result[i]->children_;
        result.insert(result.end(), children.begin(), children.end());
    }
    return result;
}

void
Logging::Category::
activate(bool recurse)
{
    std::lock_guard<std::mutex> guard(logLock());
    for (Category * category: subtree(recurse)) {
        category->enabled_ = true;
    }
}

void
Logging::Category::
writeTo(std::shared_ptr<Writer> writer, bool recurse)
{
    std::lock_guard<std::mutex> guard(logLock());
    for (Category * category: subtree(recurse)) {
        category->writer_ = writer;
    }
}

void
Logging::Category::
writeAllTo(std::string const & format)
{
    std::shared_ptr<Writer> writer;
    if (format == "console") {
        writer = std::make_shared<ConsoleWriter>(isatty(STDERR_FILENO));
    }
    else if (format == "json") {
        writer = std::make_shared<JsonWriter>();
    }
    else {
        throw Exception("unknown log format '" + format + "'");
    }
    root().writeTo(writer);
}

std::ostream &
Logging::Category::
beginWrite(char const * function, char const * file, int line)
{
    Date now = Date::now();

    logLock().lock();
    timestamp_ = now;
    function_ = function;
    file_ = file;
    line_ = line;
    return stream_;
}

std::string
Logging::Category::
endWrite()
{
    std::string text = chomp(stream_.str());
    stream_.str("");
    return text;
}


/*****************************************************************************/
/* PRINTER AND THROWER                                                       */
/*****************************************************************************/

void
Logging::Printer::
operator&(std::ostream & stream)
{
    std::lock_guard<std::mutex> guard(logLock(), std::adopt_lock);
    std::string text = category.endWrite();
    category.writer_->write(category.timestamp_, category.name(),
                            category.function_, category.file_,
                            category.line_, text);
}

void
Logging::Thrower::
operator&(std::ostream & stream)
{
    std::string text;
    {
        std::lock_guard<std::mutex> guard(logLock(), std::adopt_lock);
        text = category.endWrite();
        if (!category.isDisabled()) {
            category.writer_->write(category.timestamp_, category.name(),
                                    category.function_, category.file_,
                                    category.line_, text);
        }
    }
    throw Exception(text);
}

} // namespace Coderun
