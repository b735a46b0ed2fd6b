#define BOOST_TEST_MODULE stomp-ws

#include <boost/test/unit_test.hpp>
