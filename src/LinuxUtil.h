#pragma once

#include "Tools.h"

#include <vector>
#include <string>
#include <exception>
#include <ctime>
#include <stdint.h>

namespace EdgeSync
{
    /** Convenience class to throw exception with errno error codes and get
     * proper error names for them. */
    class UnixException : public std::exception
    {
    public:
        UnixException(const char *who, int error_code);
        UnixException (const std::string &who, int error_code);
        const char* what() const noexcept(true);
        int error_code() const { return m_ErrorCode; }

    private:
        std::string m_Who;
        int m_ErrorCode;
        mutable std::string m_Message;
        mutable bool m_MessageDone;
    };

    /** Read the contents of file_name into data.  An exception is thrown if
     * there is a problem, in which case the contents of 'data' is
     * undefined.
     */
    void ReadData(const std::string &file_name, Buffer &data);

    /** Write the contents of 'data' to 'file_name'.  This is done such that
     * there is a minimal chance of having partial data written to disk.
     */
    void WriteData(const std::string &file_name, const Buffer &data);

    /** Make sure that all directories in 'path' exist (create them if they
     * don't)
     */
    void MakeDirectoryPath(const std::string &path);

    /** Remove 'file_name', a missing file is not an error. */
    void RemoveFile(const std::string &file_name);

    bool IsDirectory(const std::string &path);
    bool FileExists(const std::string &path);

    /** Set the access and modification times of 'path' to 't'. */
    void SetFileTime(const std::string &path, std::time_t t);

    std::string JoinPath(const std::string &dir, const std::string &name);
    std::string BaseName(const std::string &path);
    std::string DirName(const std::string &path);

    /** Return the base path where user data is to be stored.  On Linux, this
     * is the user's home directory.
     */
    std::string GetUserDataDir();

    /** Try to write the current process PID into `pid_file_name' in an
     * exclusive mode, will fail if another running process has its PID
     * written in the same file. Return true if the PID lock was succesfully
     * aquired.
     */
    bool AquirePidLock(const char *pid_file_name);

    /** Release the PID lock aquired by `AquirePidLock()'. */
    void ReleasePidLock(const char *pid_file_name);


    // ........................................................ FileInfo ....

    struct FileInfo
    {
        std::string Path;               // relative to the scanned root
        uint64_t Size;
        std::time_t Modified;
    };

    /** Return all regular files below 'root', recursively.  Paths are
     * relative to 'root' and use '/' as the separator.  Directories are
     * visited breadth first.
     */
    std::vector<FileInfo> ListDirectoryTree(const std::string &root);


    // ..................................................... PartialFile ....

    /** A file being written sequentially under a temporary name.  The data
     * goes into "<file_name>.part", Commit() renames it to its final name.
     * If the object is destroyed without a Commit(), the partial file is
     * closed and removed.
     */
    class PartialFile
    {
    public:
        explicit PartialFile(const std::string &file_name);
        ~PartialFile();

        void Write(const unsigned char *data, size_t size);

        /** Flush the data to disk and close the file, but don't rename
         * it. */
        void Close();

        /** Close the file (if still open) and move it to its final name. */
        void Commit();

        /** Close and remove the partial file. */
        void Discard();

        const std::string& FileName() const { return m_FileName; }
        const std::string& PartName() const { return m_PartName; }
        uint64_t BytesWritten() const { return m_BytesWritten; }

    private:
        PartialFile(const PartialFile&);
        PartialFile& operator=(const PartialFile&);

        std::string m_FileName;
        std::string m_PartName;
        int m_Fd;
        uint64_t m_BytesWritten;
        bool m_Committed;
    };

};                                      // end namespace EdgeSync

/*
    Local Variables:
    mode: c++
    End:
*/
