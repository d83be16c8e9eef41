/* file_functions.h                                                -*- C++ -*-
   Jeremy Barnes, 30 January 2005
   Copyright (c) 2005 Jeremy Barnes.  All rights reserved.
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   Functions to deal with files.
*/

#ifndef __coderun__utils__file_functions_h__
#define __coderun__utils__file_functions_h__

#include <string>

namespace Coderun {

void delete_file(const std::string & filename);

void set_file_flag(int fd, int newFlag);
void unset_file_flag(int fd, int oldFlag);
bool is_file_flag_set(int fd, int flag);

/** Does the file exist? */
bool fileExists(const std::string & filename);

/** Write the whole of the given buffer to the file descriptor, retrying
    on EINTR and short writes.  Throws on error.
*/
void write_all(int fd, const char * data, size_t size);

/** Directory used for temporary files: $TMPDIR if set, otherwise /tmp. */
std::string temp_directory();


/*****************************************************************************/
/* TEMP FILE                                                                 */
/*****************************************************************************/

/** A uniquely named file in the temporary directory that holds the given
    contents.  The file is removed when the object is destroyed, however the
    owner leaves scope.
*/

struct TempFile {
    TempFile(const std::string & contents,
             const std::string & suffix = "",
             const std::string & prefix = "coderun-");
    ~TempFile();

    TempFile(const TempFile &) = delete;
    TempFile & operator = (const TempFile &) = delete;

    const std::string & path() const { return path_; }

    /** Remove the file now.  Throws if it could not be removed; calling it
        a second time does nothing. */
    void remove();

private:
    std::string path_;
    bool removed_;
};

} // namespace Coderun

#endif /* __coderun__utils__file_functions_h__ */
