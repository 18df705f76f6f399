#pragma once

#include <string>
#include <cstddef>
#include <string_view>

namespace faultscan::tools::scan::io{
    /*
    Cuts a byte stream fed in arbitrary chunks into '\n' terminated lines.
    A line longer than max_line_bytes is not buffered: it is reported once as oversized
    (empty view) when its terminator, or the end of the stream, is reached.
    A final line without '\n' is still emitted.
    */
    class LineSplitter{
        public:
            explicit LineSplitter(std::size_t max_line_bytes) : max_(max_line_bytes){}

            // on_line(std::string_view line, bool oversized)
            template <class F>
            void feed(std::string_view chunk, F&& on_line){
                while (!chunk.empty()){
                    const std::size_t nl = chunk.find('\n');
                    const std::string_view piece = chunk.substr(0, nl);
                    append_(piece);

                    if (nl == std::string_view::npos) return;
                    emit_(on_line);
                    chunk.remove_prefix(nl + 1);
                }
            }

            // flush an unterminated last line
            template <class F>
            void finish(F&& on_line){
                if (!pending_.empty() || overflow_) emit_(on_line);
            }

        private:
            void append_(std::string_view piece){
                if (overflow_) return;
                if (pending_.size() + piece.size() > max_){
                    overflow_ = true;
                    pending_.clear();
                    return;
                }
                pending_.append(piece);
            }

            template <class F>
            void emit_(F& on_line){
                if (overflow_) on_line(std::string_view{}, true);
                else on_line(std::string_view(pending_), false);
                pending_.clear();
                overflow_ = false;
            }

            std::string pending_;
            bool overflow_{false};
            std::size_t max_;
    };
} // namespace faultscan::tools::scan::io
