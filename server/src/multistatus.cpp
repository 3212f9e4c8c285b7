#include "atlas/server/multistatus.hpp"

#include <utility>
#include <vector>

namespace atlas::server
{

    namespace
    {

        struct Attribute
        {
            std::string_view name;
            std::string_view value;
        };

        enum class TagKind
        {
            Start,
            End,
            Empty
        };

        struct Tag
        {
            TagKind kind{TagKind::Start};
            std::string_view name;
            std::vector<Attribute> attributes;
            std::size_t begin{};
        };

        bool is_space(char ch)
        {
            return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
        }

        // Walks element tags in document order. Stops (returns std::nullopt) at
        // the end of input or at the first piece of malformed markup.
        class MarkupScanner
        {
        public:
            explicit MarkupScanner(std::string_view body) : body_(body) {}

            std::optional<Tag> next()
            {
                for (;;)
                {
                    const auto open = body_.find('<', pos_);
                    if (open == std::string_view::npos)
                    {
                        return std::nullopt;
                    }
                    pos_ = open;
                    const auto rest = body_.substr(open);
                    if (rest.starts_with("<!--"))
                    {
                        if (!skip_past(open + 4, "-->"))
                        {
                            return std::nullopt;
                        }
                        continue;
                    }
                    if (rest.starts_with("<![CDATA["))
                    {
                        if (!skip_past(open + 9, "]]>"))
                        {
                            return std::nullopt;
                        }
                        continue;
                    }
                    if (rest.starts_with("<?"))
                    {
                        if (!skip_past(open + 2, "?>"))
                        {
                            return std::nullopt;
                        }
                        continue;
                    }
                    if (rest.starts_with("<!"))
                    {
                        if (!skip_declaration(open + 2))
                        {
                            return std::nullopt;
                        }
                        continue;
                    }
                    return read_tag(open);
                }
            }

        private:
            bool skip_past(std::size_t from, std::string_view terminator)
            {
                const auto found = body_.find(terminator, from);
                if (found == std::string_view::npos)
                {
                    return false;
                }
                pos_ = found + terminator.size();
                return true;
            }

            // <!DOCTYPE ...> with an optional [internal subset].
            bool skip_declaration(std::size_t from)
            {
                int depth = 0;
                for (auto i = from; i < body_.size(); ++i)
                {
                    const char ch = body_[i];
                    if (ch == '[')
                    {
                        ++depth;
                    }
                    else if (ch == ']')
                    {
                        --depth;
                    }
                    else if (ch == '>' && depth <= 0)
                    {
                        pos_ = i + 1;
                        return true;
                    }
                }
                return false;
            }

            void skip_spaces(std::size_t &i) const
            {
                while (i < body_.size() && is_space(body_[i]))
                {
                    ++i;
                }
            }

            std::optional<Tag> read_tag(std::size_t open)
            {
                Tag tag;
                tag.begin = open;
                auto i = open + 1;
                if (i < body_.size() && body_[i] == '/')
                {
                    tag.kind = TagKind::End;
                    ++i;
                }

                const auto name_begin = i;
                while (i < body_.size() && !is_space(body_[i]) && body_[i] != '>' && body_[i] != '/')
                {
                    ++i;
                }
                if (i == name_begin || i >= body_.size())
                {
                    return std::nullopt;
                }
                tag.name = body_.substr(name_begin, i - name_begin);

                for (;;)
                {
                    skip_spaces(i);
                    if (i >= body_.size())
                    {
                        return std::nullopt;
                    }
                    if (body_[i] == '>')
                    {
                        pos_ = i + 1;
                        return tag;
                    }
                    if (body_[i] == '/')
                    {
                        if (tag.kind == TagKind::End || i + 1 >= body_.size() || body_[i + 1] != '>')
                        {
                            return std::nullopt;
                        }
                        tag.kind = TagKind::Empty;
                        pos_ = i + 2;
                        return tag;
                    }
                    if (tag.kind == TagKind::End)
                    {
                        return std::nullopt;
                    }

                    const auto attr_begin = i;
                    while (i < body_.size() && !is_space(body_[i]) && body_[i] != '=' && body_[i] != '>' &&
                           body_[i] != '/')
                    {
                        ++i;
                    }
                    const auto attr_name = body_.substr(attr_begin, i - attr_begin);
                    skip_spaces(i);
                    if (attr_name.empty() || i >= body_.size() || body_[i] != '=')
                    {
                        return std::nullopt;
                    }
                    ++i;
                    skip_spaces(i);
                    if (i >= body_.size() || (body_[i] != '"' && body_[i] != '\''))
                    {
                        return std::nullopt;
                    }
                    const char quote = body_[i++];
                    const auto close = body_.find(quote, i);
                    if (close == std::string_view::npos)
                    {
                        return std::nullopt;
                    }
                    tag.attributes.push_back(Attribute{attr_name, body_.substr(i, close - i)});
                    i = close + 1;
                }
            }

            std::string_view body_;
            std::size_t pos_{0};
        };

        std::pair<std::string_view, std::string_view> split_qname(std::string_view name)
        {
            const auto colon = name.find(':');
            if (colon == std::string_view::npos)
            {
                return {std::string_view{}, name};
            }
            return {name.substr(0, colon), name.substr(colon + 1)};
        }

        using Scope = std::vector<std::pair<std::string_view, std::string_view>>;

        Scope declarations_of(const Tag &tag)
        {
            Scope scope;
            for (const auto &attribute : tag.attributes)
            {
                if (attribute.name == "xmlns")
                {
                    scope.emplace_back(std::string_view{}, attribute.value);
                }
                else if (attribute.name.starts_with("xmlns:"))
                {
                    scope.emplace_back(attribute.name.substr(6), attribute.value);
                }
            }
            return scope;
        }

        std::optional<std::string_view> resolve(const std::vector<Scope> &scopes, std::string_view prefix)
        {
            for (auto scope = scopes.rbegin(); scope != scopes.rend(); ++scope)
            {
                for (const auto &[declared, uri] : *scope)
                {
                    if (declared == prefix)
                    {
                        if (uri.empty())
                        {
                            return std::nullopt;
                        }
                        return uri;
                    }
                }
            }
            return std::nullopt;
        }

    } // namespace

    std::string detect_dav_prefix(std::string_view body)
    {
        MarkupScanner scanner(body);
        while (const auto tag = scanner.next())
        {
            if (tag->kind == TagKind::End)
            {
                continue;
            }
            for (const auto &attribute : tag->attributes)
            {
                if (attribute.name.starts_with("xmlns:") && attribute.name.size() > 6 &&
                    attribute.value == kDavNamespace)
                {
                    return std::string(attribute.name.substr(6));
                }
            }
        }
        return std::string(kDefaultDavPrefix);
    }

    std::optional<std::size_t> find_prop_end_tag(std::string_view body)
    {
        MarkupScanner scanner(body);
        std::vector<Scope> scopes;
        while (const auto tag = scanner.next())
        {
            switch (tag->kind)
            {
            case TagKind::Start:
                scopes.push_back(declarations_of(*tag));
                break;
            case TagKind::Empty:
                break;
            case TagKind::End:
            {
                const auto [prefix, local] = split_qname(tag->name);
                if (local == "prop")
                {
                    const auto uri = resolve(scopes, prefix);
                    if (!uri || *uri == kDavNamespace)
                    {
                        return tag->begin;
                    }
                }
                if (!scopes.empty())
                {
                    scopes.pop_back();
                }
                break;
            }
            }
        }
        return std::nullopt;
    }

    std::string quota_properties_xml(std::string_view prefix, const DiskUsage &usage)
    {
        const std::string p(prefix);
        const auto available = std::to_string(usage.free_bytes);
        const auto used = std::to_string(usage.used_bytes);
        return "<" + p + ":quota-available-bytes>" + available + "</" + p + ":quota-available-bytes>" +
               "<" + p + ":quota-used-bytes>" + used + "</" + p + ":quota-used-bytes>";
    }

    bool inject_quota_properties(std::string &body, const DiskUsage &usage)
    {
        const auto position = find_prop_end_tag(body);
        if (!position)
        {
            return false;
        }
        body.insert(*position, quota_properties_xml(detect_dav_prefix(body), usage));
        return true;
    }

} // namespace atlas::server
