// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#include "curl_ftp.h"
#include <algorithm>
#include <zen/file_io.h>
#include <zen/scope_guard.h>
#include <zen/socket.h>
#include <zen/string_tools.h>
#include <libcurl/curl_wrap.h> //DON'T include <curl/curl.h> directly!
    #include <fcntl.h>

using namespace zen;
using namespace uxf;


namespace
{
const int DEFAULT_CONNECT_TIMEOUT_SEC = 30; //reachability check only: libcurl keeps its own defaults if no timeout is configured


std::vector<std::string_view> splitFtpResponse(std::string&&) = delete;

std::vector<std::string_view> splitFtpResponse(const std::string& buf)
{
    std::vector<std::string_view> lines;

    std::string_view rest = buf;
    for (;;)
    {
        const auto it = std::find_if(rest.begin(), rest.end(), [](char c) { return isLineBreak(c) || c == '\0'; });
        const std::string_view block = rest.substr(0, it - rest.begin());

        if (!block.empty()) //consider Windows' <CR><LF>
            lines.push_back(block);

        if (it == rest.end())
            return lines;
        rest.remove_prefix(it - rest.begin() + 1);
    }
}


std::string formatOctalMode(int mode)
{
    std::string output;
    for (int i = 0; i < 4; ++i)
    {
        output.insert(output.begin(), static_cast<char>('0' + (mode & 07)));
        mode >>= 3;
    }
    return output;
}


//"20170113063314" or "20170113063314.123" => UTC
time_t parseFtpTimeStamp(std::string_view timeStamp) //throw SysError
{
    timeStamp = beforeLast(timeStamp, '.', IfNotFoundReturn::all); //truncate millisecond precision if available

    if (timeStamp.size() != 14 || !std::all_of(timeStamp.begin(), timeStamp.end(), [](char c) { return isDigit(c); }))
        throw SysError("Modification time is invalid. (" + std::string(timeStamp) + ')');

    std::tm tc = {};
    tc.tm_year = stringTo<int>(timeStamp.substr(0, 4)) - 1900;
    tc.tm_mon  = stringTo<int>(timeStamp.substr(4, 2)) - 1;
    tc.tm_mday = stringTo<int>(timeStamp.substr(6, 2));
    tc.tm_hour = stringTo<int>(timeStamp.substr(8, 2));
    tc.tm_min  = stringTo<int>(timeStamp.substr(10, 2));
    tc.tm_sec  = stringTo<int>(timeStamp.substr(12, 2));

    const time_t utcTime = ::timegm(&tc);
    if (utcTime == -1)
        throw SysError("Modification time is invalid. (" + std::string(timeStamp) + ')');
    return utcTime;
}


//"213 <value>" => value
std::optional<std::string_view> getResponse213(const std::string& serverResponse)
{
    for (const std::string_view& line : splitFtpResponse(serverResponse))
        if (startsWith(line, "213 "))
            return trimCpy(line.substr(4));
    return std::nullopt;
}


class CurlFtpConnection : public FtpConnection
{
public:
    CurlFtpConnection(const std::string& server, int port, bool useTls, std::optional<int> timeoutSec) :
        server_(server),
        port_(port),
        useTls_(useTls),
        timeoutSec_(timeoutSec) {}

    ~CurlFtpConnection()
    {
        if (easyHandle_)
            ::curl_easy_cleanup(easyHandle_); //sends QUIT
    }

    void login(const std::string& username, const std::string& password) override //throw SysError
    {
        username_ = username;
        password_ = password;

        //libcurl logs in lazily => force control connection + USER/PASS right now
        runSingleFtpCommand("NOOP"); //throw SysError
    }

    void setPassive(bool passive) override { passive_ = passive; }

    std::string pwd() override { return parsePwdResponse(runSingleFtpCommand("PWD")); } //throw SysError

    void chdir(const std::string& dirPath) override { runSingleFtpCommand("CWD " + dirPath); } //throw SysError

    std::vector<std::string> nlist(const std::string& dirPath) override //throw SysError
    {
        std::vector<std::string> output;
        const std::string listing = readListing(dirPath, {{CURLOPT_DIRLISTONLY, 1L}}); //throw SysError
        for (const std::string_view& line : splitFtpResponse(listing))
            output.emplace_back(line);
        return output;
    }

    std::vector<std::string> rawList(const std::string& dirPath, bool recursive) override //throw SysError
    {
        std::vector<std::string> output;
        const std::string listing = readListing(dirPath, {{CURLOPT_CUSTOMREQUEST, recursive ? "LIST -R" : "LIST"}}); //throw SysError
        for (const std::string_view& line : splitFtpResponse(listing))
            output.emplace_back(line);
        return output;
    }

    std::vector<FtpFacts> mlsd(const std::string& dirPath) override //throw SysError
    {
        std::vector<FtpFacts> output;
        const std::string listing = readListing(dirPath, {{CURLOPT_CUSTOMREQUEST, "MLSD"}}); //throw SysError
        for (const std::string_view& line : splitFtpResponse(listing))
            if (std::optional<FtpFacts> facts = parseMlsdLine(line)) //throw SysError
                output.push_back(std::move(*facts));
        return output;
    }

    void download(const std::string& remotePath, const std::string& localFilePath) override //throw SysError
    {
        std::optional<SysError> callbackException;
        try
        {
            FileOutputPlain fileOut(localFilePath, FileOutputMode::overwrite); //throw FileError
            //not closed on error => ~FileOutputPlain() deletes the incomplete file

            auto onBytesReceived = [&](const char* buffer, size_t bytesToWrite) -> size_t
            {
                try
                {
                    for (size_t bytesWritten = 0; bytesWritten < bytesToWrite; )
                        bytesWritten += fileOut.tryWrite(buffer + bytesWritten, bytesToWrite - bytesWritten); //throw FileError
                    return bytesToWrite;
                }
                catch (const FileError& e)
                {
                    callbackException = SysError(e.toString());
                    return 0; //signal error condition => CURLE_WRITE_ERROR
                }
            };
            curl_write_callback onBytesReceivedWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
            {
                return (*static_cast<decltype(onBytesReceived)*>(callbackData))(buffer, size * nitems); //free this poor little C-API from its shackles and redirect to a proper lambda
            };

            perform(remotePath, false /*isDir*/,
            {
                {CURLOPT_WRITEDATA, &onBytesReceived},
                {CURLOPT_WRITEFUNCTION, onBytesReceivedWrapper},
                {CURLOPT_IGNORE_CONTENT_LENGTH, 1L}, //skip FTP "SIZE" command before download
            }); //throw SysError

            fileOut.close(); //throw FileError
        }
        catch (const FileError& e) { throw SysError(e.toString()); }
        catch (const SysError&)
        {
            if (callbackException)
                throw* callbackException;
            throw;
        }
    }

    void upload(const std::string& localFilePath, const std::string& remotePath) override //throw SysError
    {
        std::optional<SysError> callbackException;
        try
        {
            FileInputPlain fileIn(localFilePath); //throw FileError

            auto getBytesToSend = [&](char* buffer, size_t bytesToRead) -> size_t
            {
                try
                {
                    if (bytesToRead == 0) //FileInputPlain::tryRead() contract
                        return 0;
                    return fileIn.tryRead(buffer, bytesToRead); //throw FileError; 0 means EOF
                }
                catch (const FileError& e)
                {
                    callbackException = SysError(e.toString());
                    return CURL_READFUNC_ABORT; //signal error condition => CURLE_ABORTED_BY_CALLBACK
                }
            };
            curl_read_callback getBytesToSendWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
            {
                return (*static_cast<decltype(getBytesToSend)*>(callbackData))(buffer, size * nitems); //free this poor little C-API from its shackles and redirect to a proper lambda
            };

            perform(remotePath, false /*isDir*/,
            {
                {CURLOPT_UPLOAD, 1L},
                {CURLOPT_READDATA, &getBytesToSend},
                {CURLOPT_READFUNCTION, getBytesToSendWrapper},
            }); //throw SysError
        }
        catch (const FileError& e) { throw SysError(e.toString()); }
        catch (const SysError&)
        {
            if (callbackException)
                throw* callbackException;
            throw;
        }
    }

    void deleteFile     (const std::string& filePath) override { runSingleFtpCommand("DELE " + filePath); } //throw SysError
    void makeDirectory  (const std::string& dirPath ) override { runSingleFtpCommand("MKD "  + dirPath ); } //throw SysError
    void removeDirectory(const std::string& dirPath ) override { runSingleFtpCommand("RMD "  + dirPath ); } //throw SysError

    void rename(const std::string& pathFrom, const std::string& pathTo) override //throw SysError
    {
        curl_slist* quote = nullptr;
        ZEN_ON_SCOPE_EXIT(::curl_slist_free_all(quote));
        quote = ::curl_slist_append(quote, ("RNFR " + pathFrom).c_str());
        quote = ::curl_slist_append(quote, ("RNTO " + pathTo  ).c_str());

        perform("", true /*isDir*/,
        {
            {CURLOPT_NOBODY, 1L},
            {CURLOPT_QUOTE, quote},
        }); //throw SysError
    }

    void chmod(const std::string& itemPath, int mode) override //throw SysError
    {
        runSingleFtpCommand("SITE CHMOD " + formatOctalMode(mode) + ' ' + itemPath); //throw SysError
    }

    int64_t getSize(const std::string& filePath) override //throw SysError
    {
        const std::string& response = runSingleFtpCommand("SIZE " + filePath); //throw SysError

        if (const std::optional<std::string_view> sizeStr = getResponse213(response);
            sizeStr && !sizeStr->empty() && std::all_of(sizeStr->begin(), sizeStr->end(), [](char c) { return isDigit(c); }))
            return stringTo<int64_t>(*sizeStr);
        return -1;
    }

    time_t getModTime(const std::string& filePath) override //throw SysError
    {
        const std::string& response = runSingleFtpCommand("MDTM " + filePath); //throw SysError

        if (const std::optional<std::string_view> timeStr = getResponse213(response))
            return parseFtpTimeStamp(*timeStr); //throw SysError
        return -1;
    }

    void close() override
    {
        if (easyHandle_)
        {
            ::curl_easy_cleanup(easyHandle_); //sends QUIT
            easyHandle_ = nullptr;
        }
    }

private:
    CurlFtpConnection           (const CurlFtpConnection&) = delete;
    CurlFtpConnection& operator=(const CurlFtpConnection&) = delete;

    //returns server response (header data)
    std::string perform(const std::string& itemPath, bool isDir, const std::vector<CurlOption>& extraOptions) //throw SysError
    {
        if (!easyHandle_)
        {
            easyHandle_ = ::curl_easy_init();
            if (!easyHandle_)
                throw SysError(formatSystemError("curl_easy_init", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), ""));
        }
        else
            ::curl_easy_reset(easyHandle_); //keeps the connection alive

        char curlErrorBuf[CURL_ERROR_SIZE] = {};
        setCurlOption(easyHandle_, {CURLOPT_ERRORBUFFER, curlErrorBuf}); //throw SysError

        std::string headerData;
        curl_write_callback onHeaderReceived = [](/*const*/ char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            auto& output = *static_cast<std::string*>(callbackData);
            output.append(buffer, size * nitems);
            return size * nitems;
        };
        setCurlOption(easyHandle_, {CURLOPT_HEADERDATA, &headerData}); //throw SysError
        setCurlOption(easyHandle_, {CURLOPT_HEADERFUNCTION, onHeaderReceived}); //throw SysError

        setCurlOption(easyHandle_, {CURLOPT_URL, getCurlUrlPath(itemPath, isDir).c_str()}); //throw SysError

        //relative paths must be resolved by the server against its working directory => never CWD on our own
        setCurlOption(easyHandle_, {CURLOPT_FTP_FILEMETHOD, CURLFTPMETHOD_NOCWD}); //throw SysError

        if (!username_.empty()) //else: libcurl will default to CURL_DEFAULT_USER("anonymous") and CURL_DEFAULT_PASSWORD("ftp@example.com")
        {
            setCurlOption(easyHandle_, {CURLOPT_USERNAME, username_.c_str()}); //throw SysError
            setCurlOption(easyHandle_, {CURLOPT_PASSWORD, password_.c_str()}); //throw SysError
        }

        setCurlOption(easyHandle_, {CURLOPT_PORT, static_cast<long>(port_)}); //throw SysError

        setCurlOption(easyHandle_, {CURLOPT_NOSIGNAL, 1L}); //throw SysError

        //allow PASV IP: some FTP servers really use IP different from control connection
        setCurlOption(easyHandle_, {CURLOPT_FTP_SKIP_PASV_IP, 0L}); //throw SysError

        if (!passive_)
            setCurlOption(easyHandle_, {CURLOPT_FTPPORT, "-"}); //throw SysError; active mode: "-" => same IP as control connection

        if (timeoutSec_)
        {
            setCurlOption(easyHandle_, {CURLOPT_CONNECTTIMEOUT, static_cast<long>(*timeoutSec_)}); //throw SysError

            //CURLOPT_TIMEOUT: "Since this puts a hard limit for how long time a request is allowed to take, it has limited use in dynamic use cases with varying transfer times."
            setCurlOption(easyHandle_, {CURLOPT_LOW_SPEED_TIME, static_cast<long>(*timeoutSec_)}); //throw SysError
            setCurlOption(easyHandle_, {CURLOPT_LOW_SPEED_LIMIT, 1L /*[bytes]*/}); //throw SysError
            //can't use "0" which means "inactive", so use some low number

            setCurlOption(easyHandle_, {CURLOPT_SERVER_RESPONSE_TIMEOUT, static_cast<long>(*timeoutSec_)}); //throw SysError
            //FTP only; unlike CURLOPT_TIMEOUT, this one is NOT a limit on the total transfer time
        }

        //long-running file uploads require keep-alives for the TCP control connection
        setCurlOption(easyHandle_, {CURLOPT_TCP_KEEPALIVE, 1L}); //throw SysError

        std::optional<SysError> socketException;
        //libcurl does *not* set FD_CLOEXEC for us!
        auto onSocketCreate = [&](curl_socket_t curlfd, curlsocktype purpose)
        {
            if (::fcntl(curlfd, F_SETFD, FD_CLOEXEC) == -1)
            {
                socketException = SysError(formatSystemError("fcntl(FD_CLOEXEC)", errno));
                return CURL_SOCKOPT_ERROR;
            }
            return CURL_SOCKOPT_OK;
        };

        using SocketCbType = decltype(onSocketCreate);
        using SocketCbWrapperType =            int (*)(SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose); //needed for cdecl function pointer cast
        SocketCbWrapperType onSocketCreateWrapper = [](SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose)
        {
            return (*clientp)(curlfd, purpose); //free this poor little C-API from its shackles and redirect to a proper lambda
        };

        setCurlOption(easyHandle_, {CURLOPT_SOCKOPTFUNCTION, onSocketCreateWrapper}); //throw SysError
        setCurlOption(easyHandle_, {CURLOPT_SOCKOPTDATA, &onSocketCreate}); //throw SysError

        setCurlOption(easyHandle_, {CURLOPT_CAINFO, 0L}); //throw SysError
        //be explicit: "even when [CURLOPT_SSL_VERIFYPEER] is disabled [...] curl may still load the certificate file specified in CURLOPT_CAINFO."

        //check if server certificate can be trusted? (Default: 1L)
        setCurlOption(easyHandle_, {CURLOPT_SSL_VERIFYPEER, 0L}); //throw SysError
        //check that server name matches the name in the certificate? (Default: 2L)
        setCurlOption(easyHandle_, {CURLOPT_SSL_VERIFYHOST, 0L}); //throw SysError

        if (useTls_) //https://tools.ietf.org/html/rfc4217
        {
            //require SSL for both control and data:
            setCurlOption(easyHandle_, {CURLOPT_USE_SSL,    CURLUSESSL_ALL}); //throw SysError
            //try TLS first, then SSL (currently: CURLFTPAUTH_DEFAULT == CURLFTPAUTH_SSL):
            setCurlOption(easyHandle_, {CURLOPT_FTPSSLAUTH, CURLFTPAUTH_TLS}); //throw SysError
        }

        for (const CurlOption& option : extraOptions)
            setCurlOption(easyHandle_, option); //throw SysError

        //=======================================================================================================
        const CURLcode rcPerf = ::curl_easy_perform(easyHandle_);
        //curl_easy_perform() considers FTP response codes >= 400 as failure

        if (socketException)
            throw* socketException; //throw SysError
        //=======================================================================================================

        if (rcPerf != CURLE_OK)
        {
            std::string errorMsg(trimCpy(curlErrorBuf)); //optional

            if (const std::vector<std::string_view>& headerLines = splitFtpResponse(headerData);
                !headerLines.empty())
                if (const std::string_view& response = trimCpy(headerLines.back()); //that *should* be the server's error response
                    !response.empty())
                    errorMsg += (errorMsg.empty() ? "" : "\n") + std::string(response);

            throw SysError(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg));
        }
        return headerData;
    }

    //returns server response (header data)
    std::string runSingleFtpCommand(const std::string& ftpCmd) //throw SysError
    {
        curl_slist* quote = nullptr;
        ZEN_ON_SCOPE_EXIT(::curl_slist_free_all(quote));
        quote = ::curl_slist_append(quote, ftpCmd.c_str());

        return perform("", true /*isDir*/,
        {
            {CURLOPT_NOBODY, 1L},
            {CURLOPT_QUOTE, quote},
        }); //throw SysError
    }

    std::string readListing(const std::string& dirPath, std::vector<CurlOption> options) //throw SysError
    {
        std::string rawListing;

        curl_write_callback onBytesReceived = [](/*const*/ char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            auto& listing = *static_cast<std::string*>(callbackData);
            listing.append(buffer, size * nitems);
            return size * nitems;
        };
        options.emplace_back(CURLOPT_WRITEDATA, &rawListing);
        options.emplace_back(CURLOPT_WRITEFUNCTION, onBytesReceived);

        perform(dirPath, true /*isDir*/, options); //throw SysError
        return rawListing;
    }

    std::string getCurlUrlPath(const std::string& itemPath, bool isDir) //throw SysError
    {
        std::string curlRelPath; //libcurl expects encoded paths (except for '/' char!!!)

        split(itemPath, '/', [&](std::string_view comp)
        {
            if (!comp.empty() && comp != ".")
            {
                char* compFmt = ::curl_easy_escape(easyHandle_, comp.data(), static_cast<int>(comp.size()));
                if (!compFmt)
                    throw SysError(formatSystemError("curl_easy_escape(" + std::string(comp) + ')', "", "Conversion failure"));
                ZEN_ON_SCOPE_EXIT(::curl_free(compFmt));

                if (!curlRelPath.empty())
                    curlRelPath += '/';
                curlRelPath += compFmt;
            }
        });

        if (trimCpy(server_).empty())
            throw SysError("Server name must not be empty.");

        /*  CURLFTPMETHOD_NOCWD: the URL path is passed to the server as is, minus the first slash
              "ftp://server/dir/file"  => relative to the server's working directory
              "ftp://server//dir/file" => absolute                                            */
        std::string path = "ftp://" + server_ + '/';
        if (startsWith(itemPath, '/'))
            path += '/';
        path += curlRelPath;

        if (isDir && !endsWith(path, '/')) //curl-FTP needs directory paths to end with a slash
            path += '/';
        return path;
    }

    const std::string server_;
    const int port_;
    const bool useTls_;
    const std::optional<int> timeoutSec_;

    std::string username_;
    std::string password_;
    bool passive_ = true;

    CURL* easyHandle_ = nullptr;
};
}


std::unique_ptr<FtpConnection> CurlFtpConnector::connect(const std::string& server, int port, bool useTls, std::optional<int> timeoutSec) //throw SysError
{
    {
        //libcurl connects lazily => check reachability right away
        const std::string serverPlain(trimCpy(server, TrimSide::both, [](char c) { return c == '[' || c == ']'; })); //IPv6 literal
        Socket reachable(serverPlain, numberTo<std::string>(port), timeoutSec.value_or(DEFAULT_CONNECT_TIMEOUT_SEC)); //throw SysError
    }
    return std::make_unique<CurlFtpConnection>(server, port, useTls, timeoutSec);
}


std::optional<FtpFacts> uxf::parseMlsdLine(std::string_view line) //throw SysError
{
    /*  https://tools.ietf.org/html/rfc3659
        type=cdir;sizd=4096;modify=20170116230740;UNIX.mode=0755;UNIX.uid=874;UNIX.gid=869;unique=902g36e1c55; .
        type=file;size=4;modify=20170113063314;UNIX.mode=0600;UNIX.uid=874;UNIX.gid=869;unique=902g36e1c5d; readme.txt   */
    if (startsWith(line, ' ')) //leading blank is already trimmed if MLSD was processed by curl
        line.remove_prefix(1);

    const size_t posBlank = line.find(' ');
    if (posBlank == std::string_view::npos)
        throw SysError("Item name not available. (" + std::string(line) + ')');

    const std::string_view facts    = line.substr(0, posBlank);
    const std::string_view itemName = line.substr(posBlank + 1);

    if (itemName.empty() || itemName == "." || itemName == "..")
        return std::nullopt;

    FtpFacts output;
    split(facts, ';', [&](const std::string_view fact)
    {
        if (!fact.empty())
            output[getLowerCaseAscii(beforeFirst(fact, '=', IfNotFoundReturn::all))] = afterFirst(fact, '=', IfNotFoundReturn::none);
    });

    if (const auto it = output.find("type");
        it != output.end())
        if (equalAsciiNoCase(it->second, "cdir") ||
            equalAsciiNoCase(it->second, "pdir"))
            return std::nullopt;

    output["name"] = itemName;
    return output;
}


std::string uxf::parsePwdResponse(const std::string& serverResponse) //throw SysError
{
    for (const std::string_view& line : splitFtpResponse(serverResponse))
        if (startsWith(line, "257 "))
        {
            /* 257<space>[rubbish]"<directory-name>"<space><commentary>

               "The directory name can contain any character; embedded double-quotes should be escaped by
               double-quotes (the "quote-doubling" convention)." https://tools.ietf.org/html/rfc959       */
            auto itBegin = std::find(line.begin(), line.end(), '"');
            if (itBegin != line.end())
                for (auto it = ++itBegin; it != line.end(); ++it)
                    if (*it == '"')
                    {
                        if (it + 1 != line.end() && it[1] == '"')
                            ++it; //skip double quote
                        else
                            return replaceCpy(std::string(itBegin, it), "\"\"", "\"");
                    }
            break;
        }
    throw SysError("Unexpected FTP response. (" + serverResponse + ')');
}
