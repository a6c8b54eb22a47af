#include "clipferry/bot/http_client.hpp"

#include <fstream>
#include <memory>

#include <curl/curl.h>

namespace clipferry::bot
{

    namespace
    {

        struct EasyDeleter
        {
            void operator()(CURL *handle) const noexcept { curl_easy_cleanup(handle); }
        };

        struct SlistDeleter
        {
            void operator()(curl_slist *list) const noexcept { curl_slist_free_all(list); }
        };

        struct MimeDeleter
        {
            void operator()(curl_mime *mime) const noexcept { curl_mime_free(mime); }
        };

        using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
        using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;
        using MimeForm = std::unique_ptr<curl_mime, MimeDeleter>;

        size_t append_to_string(char *data, size_t size, size_t count, void *userdata)
        {
            auto *body = static_cast<std::string *>(userdata);
            body->append(data, size * count);
            return size * count;
        }

        size_t append_to_file(char *data, size_t size, size_t count, void *userdata)
        {
            auto *file = static_cast<std::ofstream *>(userdata);
            file->write(data, static_cast<std::streamsize>(size * count));
            return file->good() ? size * count : 0;
        }

        EasyHandle open_handle(const std::string &url, const std::string &user_agent, std::chrono::seconds timeout)
        {
            EasyHandle handle(curl_easy_init());
            if (!handle)
            {
                throw HttpError("Failed to initialize CURL");
            }
            curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
            curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, user_agent.c_str());
            curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(handle.get(), CURLOPT_SSL_VERIFYPEER, 1L);
            curl_easy_setopt(handle.get(), CURLOPT_SSL_VERIFYHOST, 2L);
            curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
            curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
            return handle;
        }

        HttpResponse perform(CURL *handle)
        {
            HttpResponse response;
            curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, append_to_string);
            curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
            const auto res = curl_easy_perform(handle);
            if (res != CURLE_OK)
            {
                throw HttpError(curl_easy_strerror(res));
            }
            curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
            return response;
        }

    } // namespace

    CurlGlobal::CurlGlobal()
    {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
        {
            throw HttpError("curl_global_init failed");
        }
    }

    CurlGlobal::~CurlGlobal()
    {
        curl_global_cleanup();
    }

    HttpClient::HttpClient(std::string user_agent) : user_agent_(std::move(user_agent)) {}

    HttpResponse HttpClient::get(const std::string &url, std::chrono::seconds timeout) const
    {
        auto handle = open_handle(url, user_agent_, timeout);
        return perform(handle.get());
    }

    HttpResponse HttpClient::post_json(const std::string &url, const std::string &body,
                                       std::chrono::seconds timeout) const
    {
        auto handle = open_handle(url, user_agent_, timeout);
        HeaderList headers(curl_slist_append(nullptr, "Content-Type: application/json"));
        curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        return perform(handle.get());
    }

    HttpResponse HttpClient::post_multipart(const std::string &url, const std::vector<FormField> &fields,
                                            std::chrono::seconds timeout) const
    {
        auto handle = open_handle(url, user_agent_, timeout);
        MimeForm form(curl_mime_init(handle.get()));
        for (const auto &field : fields)
        {
            auto *part = curl_mime_addpart(form.get());
            curl_mime_name(part, field.name.c_str());
            if (field.file)
            {
                if (curl_mime_filedata(part, field.file->c_str()) != CURLE_OK)
                {
                    throw HttpError("Cannot attach " + field.file->string());
                }
            }
            else
            {
                curl_mime_data(part, field.value.c_str(), CURL_ZERO_TERMINATED);
            }
        }
        curl_easy_setopt(handle.get(), CURLOPT_MIMEPOST, form.get());
        return perform(handle.get());
    }

    long HttpClient::download(const std::string &url, const std::filesystem::path &destination,
                              std::chrono::seconds timeout) const
    {
        std::ofstream file(destination, std::ios::binary | std::ios::trunc);
        if (!file)
        {
            throw HttpError("Failed to open output file " + destination.string());
        }

        auto handle = open_handle(url, user_agent_, timeout);
        curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, append_to_file);
        curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &file);
        curl_easy_setopt(handle.get(), CURLOPT_FAILONERROR, 0L);
        const auto res = curl_easy_perform(handle.get());
        file.close();
        if (res != CURLE_OK)
        {
            throw HttpError(curl_easy_strerror(res));
        }
        long status = 0;
        curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);
        return status;
    }

} // namespace clipferry::bot
