#include "atlas/server/content_type_hint.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace atlas::server
{

    namespace
    {

        struct MimeEntry
        {
            std::string_view extension;
            std::string_view type;
        };

        constexpr std::array<MimeEntry, 34> kMimeTypes{{
            {".7z", "application/x-7z-compressed"},
            {".avif", "image/avif"},
            {".bmp", "image/bmp"},
            {".css", "text/css; charset=utf-8"},
            {".csv", "text/csv; charset=utf-8"},
            {".doc", "application/msword"},
            {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
            {".gif", "image/gif"},
            {".gz", "application/gzip"},
            {".htm", "text/html; charset=utf-8"},
            {".html", "text/html; charset=utf-8"},
            {".ico", "image/x-icon"},
            {".jpeg", "image/jpeg"},
            {".jpg", "image/jpeg"},
            {".js", "text/javascript; charset=utf-8"},
            {".json", "application/json"},
            {".md", "text/markdown; charset=utf-8"},
            {".mjs", "text/javascript; charset=utf-8"},
            {".mp3", "audio/mpeg"},
            {".mp4", "video/mp4"},
            {".pdf", "application/pdf"},
            {".png", "image/png"},
            {".ppt", "application/vnd.ms-powerpoint"},
            {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
            {".rar", "application/x-rar-compressed"},
            {".svg", "image/svg+xml"},
            {".tar", "application/x-tar"},
            {".txt", "text/plain; charset=utf-8"},
            {".wasm", "application/wasm"},
            {".webp", "image/webp"},
            {".xls", "application/vnd.ms-excel"},
            {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
            {".xml", "text/xml; charset=utf-8"},
            {".zip", "application/zip"},
        }};

        std::string extension_of(std::string_view path)
        {
            const auto slash = path.find_last_of('/');
            const auto name = slash == std::string_view::npos ? path : path.substr(slash + 1);
            const auto dot = name.find_last_of('.');
            if (dot == std::string_view::npos)
            {
                return {};
            }
            std::string extension(name.substr(dot));
            std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return extension;
        }

    } // namespace

    std::optional<std::string> content_type_for(std::string_view path)
    {
        const auto extension = extension_of(path);
        if (extension.empty())
        {
            return std::nullopt;
        }
        for (const auto &entry : kMimeTypes)
        {
            if (entry.extension == extension)
            {
                return std::string(entry.type);
            }
        }
        return std::nullopt;
    }

    ContentTypeHint::ContentTypeHint(http::HandlerPtr next) : next_(std::move(next)) {}

    void ContentTypeHint::serve(http::ResponseWriter &writer, const http::Request &request)
    {
        if (const auto type = content_type_for(request.path))
        {
            writer.headers().set("Content-Type", *type);
        }
        next_->serve(writer, request);
    }

    http::Middleware content_type_hint()
    {
        return [](http::HandlerPtr next) -> http::HandlerPtr
        {
            return std::make_shared<ContentTypeHint>(std::move(next));
        };
    }

} // namespace atlas::server
