#ifndef __RESTED_HTTP_SERVLET_H__
#define __RESTED_HTTP_SERVLET_H__
// Copyright (c) 2010 - Mozy, Inc.

#include <boost/shared_ptr.hpp>

namespace Rested {
namespace HTTP {

class ServerRequest;

/// Request handler abstraction that a hosting server drives, once per
/// request
class Servlet
{
public:
    typedef boost::shared_ptr<Servlet> ptr;

public:
    virtual ~Servlet() {}

    virtual void request(boost::shared_ptr<ServerRequest> request) = 0;
    void operator()(boost::shared_ptr<ServerRequest> requestPtr)
    { request(requestPtr); }
};

}}

#endif
