#include "mcpeasy/auth/callback_server.hpp"

#include "mcpeasy/exceptions.hpp"

#include <httplib.h>

namespace mcpeasy::auth
{

namespace
{
std::string page(const std::string& title, const std::string& body)
{
    return "<!DOCTYPE html>\n<html>\n<head>\n  <title>" + title +
           "</title>\n  <style>\n    body { font-family: Arial, sans-serif; text-align: center; "
           "padding: 50px; }\n  </style>\n</head>\n<body>\n" +
           body + "\n</body>\n</html>\n";
}

std::string html_escape(const std::string& s)
{
    std::string out;
    for (char c : s)
    {
        switch (c)
        {
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '&':
            out += "&amp;";
            break;
        case '"':
            out += "&quot;";
            break;
        default:
            out.push_back(c);
        }
    }
    return out;
}
} // namespace

CallbackServer::CallbackServer(int port, std::string host) : host_(std::move(host)), port_(port) {}

CallbackServer::~CallbackServer()
{
    stop();
}

void CallbackServer::start()
{
    svr_ = std::make_unique<httplib::Server>();
    svr_->set_read_timeout(10, 0);
    svr_->set_write_timeout(10, 0);

    svr_->Get("/",
              [this](const httplib::Request& req, httplib::Response& res)
              {
                  std::lock_guard<std::mutex> lock(mutex_);
                  if (req.has_param("code"))
                  {
                      code_ = req.get_param_value("code");
                      received_ = true;
                      res.set_content(page("Authorization Successful",
                                           "<h1>&#x2713; Authorization Successful!</h1>\n"
                                           "<p>You can now close this window and return to "
                                           "your terminal.</p>"),
                                      "text/html");
                  }
                  else if (req.has_param("error"))
                  {
                      error_ = req.get_param_value("error");
                      received_ = true;
                      res.set_content(page("Authorization Failed",
                                           "<h1>&#x2717; Authorization Failed</h1>\n<p>Error: " +
                                               html_escape(*error_) +
                                               "</p>\n<p>Please try again from your terminal.</p>"),
                                      "text/html");
                  }
                  else
                  {
                      res.set_content(page("Waiting for Authorization",
                                           "<h1>Waiting for Authorization...</h1>\n"
                                           "<p>Please complete the authorization process.</p>"),
                                      "text/html");
                  }
                  cv_.notify_all();
              });

    if (!svr_->bind_to_port(host_.c_str(), port_))
    {
        svr_.reset();
        throw AuthError("Failed to start callback server on " + host_ + ":" +
                        std::to_string(port_));
    }

    thread_ = std::thread(
        [this]()
        {
            bool ok = svr_->listen_after_bind();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!ok)
                    listening_failed_ = true;
            }
            cv_.notify_all();
        });
}

void CallbackServer::stop()
{
    if (svr_)
        svr_->stop();
    if (thread_.joinable())
        thread_.join();
    svr_.reset();
}

std::optional<std::string> CallbackServer::capture_code(std::chrono::seconds timeout)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        received_ = false;
        code_.reset();
        error_.reset();
        listening_failed_ = false;
    }

    start();

    std::optional<std::string> code;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return received_ || listening_failed_; });
        code = code_;
        if (received_)
        {
            // Let the browser receive its page before the listener goes away.
            lock.unlock();
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
    }

    stop();
    return code;
}

} // namespace mcpeasy::auth
