#include <sstream>
#include <variant>
#include "dir_tree/utils.hpp"
#include "dir_tree/render.hpp"

namespace dir_tree {

    namespace {
        constexpr int kIndentWidth = 4;

        // Pretty-printing counterpart of a flat key/value builder: objects open on
        // their own line and every member sits one indent level deeper.
        class JsonWriter {
        public:
            void begin_object() {
                stream_ << '{';
                ++depth_;
                first_ = true;
            }

            void end_object() {
                --depth_;
                if (!first_) {
                    newline();
                }
                stream_ << '}';
                first_ = false;
            }

            void add_key(const std::string& key) {
                if (!first_) {
                    stream_ << ',';
                }
                newline();
                stream_ << '"' << json_escape(key) << "\": ";
                first_ = true;
            }

            void add_string(const std::string& key, const std::string& value) {
                add_key(key);
                stream_ << '"' << json_escape(value) << '"';
                first_ = false;
            }

            void add_number(const std::string& key, uintmax_t value) {
                add_key(key);
                stream_ << value;
                first_ = false;
            }

            void add_raw(const std::string& key, const std::string& literal) {
                add_key(key);
                stream_ << literal;
                first_ = false;
            }

            std::string str() const {
                return stream_.str();
            }

        private:
            void newline() {
                stream_ << '\n' << std::string(static_cast<std::size_t>(depth_ * kIndentWidth), ' ');
            }

            int depth_ = 0;
            bool first_ = true;
            std::ostringstream stream_;
        };

        void write_metadata(JsonWriter& json, const FileMetadata& metadata) {
            json.begin_object();
            if (metadata.size) {
                if (const auto* bytes = std::get_if<uintmax_t>(&*metadata.size)) {
                    json.add_number("size", *bytes);
                } else {
                    json.add_string("size", std::get<std::string>(*metadata.size));
                }
            }
            if (metadata.modified_time) {
                if (const auto* seconds = std::get_if<double>(&*metadata.modified_time)) {
                    json.add_raw("modified_time", format_timestamp(*seconds));
                } else {
                    json.add_string("modified_time", std::get<std::string>(*metadata.modified_time));
                }
            }
            json.end_object();
        }

        void write_tree(JsonWriter& json, const DirTree& tree) {
            json.begin_object();
            for (const auto& entry : tree.entries) {
                json.add_key(entry.name);
                if (entry.is_directory) {
                    write_tree(json, entry.children);
                } else {
                    write_metadata(json, entry.file);
                }
            }
            json.end_object();
        }
    }

    std::string dir_tree_to_json(const DirTree& tree) {
        JsonWriter json;
        write_tree(json, tree);
        return json.str();
    }

    void render_json(const TreeReport& report, std::ostream& out) {
        out << dir_tree_to_json(report.tree) << "\n";
    }
}
