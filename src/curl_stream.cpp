#include "curl_stream.hpp"

#include <algorithm>

#include <fmt/core.h>

#include "logger.hpp"

CurlStream::CurlStream(ConnectionPool &pool, Protocol protocol, std::string host,
                       std::string url, std::uint64_t offset)
    : pool_(pool),
      protocol_(protocol),
      host_(std::move(host)),
      url_(std::move(url)),
      offset_(offset),
      multi_(nullptr, curl_multi_cleanup)
{
}

CurlStream::~CurlStream()
{
    stop();
}

// Static callback: libcurl calls this with each piece of received data
size_t CurlStream::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    auto *stream = static_cast<CurlStream *>(userdata);
    size_t totalSize = size * nmemb;

    // Buffer is full: keep the data inside libcurl until the next read()
    if (stream->buffer_.size() >= stream->wanted_)
    {
        stream->paused_ = true;
        return CURL_WRITEFUNC_PAUSE;
    }

    stream->buffer_.append(ptr, totalSize);
    stream->delivered_ += totalSize;
    return totalSize;
}

std::string CurlStream::read(size_t count)
{
    if (count == 0)
    {
        return {};
    }

    if (!easy_)
    {
        start();
    }

    wanted_ = count;

    if (paused_)
    {
        paused_ = false;
        CURLcode res = curl_easy_pause(easy_, CURLPAUSE_CONT);
        if (res != CURLE_OK)
        {
            throw TransportError(fmt::format("{}: {}", url_, curl_easy_strerror(res)));
        }
    }

    while (buffer_.size() < wanted_ && !done_)
    {
        pump();

        if (done_ && nothingPastOffset())
        {
            logger::debug("{} holds no data past byte {}", url_, offset_);
            result_ = CURLE_OK;
            break;
        }

        if (done_ && cannotResume())
        {
            logger::warn("Server for {} does not support resume, restarting from the beginning", url_);
            stop();
            offset_ = 0;
            start();
        }
    }

    if (buffer_.empty() && done_ && result_ != CURLE_OK)
    {
        throw TransportError(fmt::format("{}: {}", url_, curl_easy_strerror(result_)));
    }

    size_t take = std::min(count, buffer_.size());
    std::string chunk = buffer_.substr(0, take);
    buffer_.erase(0, take);
    return chunk;
}

void CurlStream::start()
{
    if (!multi_)
    {
        multi_.reset(curl_multi_init());
        if (!multi_)
        {
            throw TransportError("Failed to initialize CURL multi handle");
        }
    }

    easy_ = pool_.acquire(protocol_, host_);

    curl_easy_setopt(easy_, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(easy_, CURLOPT_NOBODY, 0L);
    curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);

    // HTTP sends "Range: bytes=N-", FTP sends "REST N"
    curl_easy_setopt(easy_, CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(offset_));

    CURLMcode mc = curl_multi_add_handle(multi_.get(), easy_);
    if (mc != CURLM_OK)
    {
        easy_ = nullptr;
        throw TransportError(fmt::format("{}: {}", url_, curl_multi_strerror(mc)));
    }

    buffer_.clear();
    delivered_ = 0;
    paused_ = false;
    done_ = false;
    result_ = CURLE_OK;
    responseCode_ = 0;
}

void CurlStream::stop()
{
    if (easy_ && multi_)
    {
        curl_multi_remove_handle(multi_.get(), easy_);
    }
    easy_ = nullptr;
    paused_ = false;
}

void CurlStream::pump()
{
    int running = 0;
    CURLMcode mc = curl_multi_perform(multi_.get(), &running);
    if (mc != CURLM_OK)
    {
        throw TransportError(fmt::format("{}: {}", url_, curl_multi_strerror(mc)));
    }

    int queued = 0;
    while (CURLMsg *msg = curl_multi_info_read(multi_.get(), &queued))
    {
        if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_)
        {
            done_ = true;
            result_ = msg->data.result;
            curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &responseCode_);
        }
    }

    if (!done_ && !paused_ && buffer_.size() < wanted_)
    {
        mc = curl_multi_poll(multi_.get(), nullptr, 0, 1000, nullptr);
        if (mc != CURLM_OK)
        {
            throw TransportError(fmt::format("{}: {}", url_, curl_multi_strerror(mc)));
        }
    }
}

bool CurlStream::cannotResume() const
{
    if (offset_ == 0 || delivered_ > 0)
    {
        return false;
    }
    return result_ == CURLE_RANGE_ERROR || result_ == CURLE_FTP_COULDNT_USE_REST;
}

bool CurlStream::nothingPastOffset() const
{
    if (offset_ == 0 || delivered_ > 0)
    {
        return false;
    }
    // HTTP 416 Range Not Satisfiable, or a file:// offset beyond the end
    return responseCode_ == 416 || result_ == CURLE_BAD_DOWNLOAD_RESUME;
}
