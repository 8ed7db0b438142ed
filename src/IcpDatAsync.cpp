/* IcpDat: a library to decode and convert ICP-MS instrument DAT files.

 This library is free software; you can redistribute it and/or
 modify it under the terms of the GNU Lesser General Public
 License as published by the Free Software Foundation; either
 version 2.1 of the License, or (at your option) any later version.

 This library is distributed in the hope that it will be useful,
 but WITHOUT ANY WARRANTY; without even the implied warranty of
 MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 Lesser General Public License for more details.

 You should have received a copy of the GNU Lesser General Public
 License along with this library; if not, write to the Free Software
 Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
 */

#include "IcpDat_config.h"

#include <atomic>
#include <string>
#include <thread>
#include <vector>
#include <iostream>
#include <algorithm>

#include "IcpDat/IcpDatAsync.h"


using namespace std;


namespace IcpDatAsync
{
  int num_logical_cpu_cores()
  {
#if( IcpDat_USING_NO_THREADING )
    return 1;
#else
    return max( 1, static_cast<int>( std::thread::hardware_concurrency() ) );
#endif
  }//int num_logical_cpu_cores()


  void do_asyncronous_work( std::vector< std::function<void(void)> > &workers,
                            const size_t maxthreads )
  {
    const size_t ncores = static_cast<size_t>( num_logical_cpu_cores() );
    const size_t nthreads = std::min( workers.size(), (maxthreads ? std::min(maxthreads, ncores) : ncores) );

    if( nthreads <= 1 )
    {
      for( std::function<void(void)> &worker : workers )
        worker();
      return;
    }

#if( IcpDat_USING_NO_THREADING )
    for( std::function<void(void)> &worker : workers )
      worker();
#else
    std::atomic<size_t> next_worker( 0 );

    auto run_workers = [&workers,&next_worker](){
      for( size_t index = next_worker++; index < workers.size(); index = next_worker++ )
        workers[index]();
    };

    vector<std::thread> threads;
    threads.reserve( nthreads - 1 );
    for( size_t i = 1; i < nthreads; ++i )
      threads.emplace_back( run_workers );

    run_workers();

    for( std::thread &t : threads )
      t.join();
#endif
  }//void do_asyncronous_work(...)


  ThreadPool::ThreadPool( const size_t maxthreads )
    : m_maxthreads( maxthreads ),
      m_exception( nullptr )
  {
  }


  ThreadPool::~ThreadPool()
  {
    // Throwing an exception from a destructor is dangerous
    try
    {
      join();
    }catch( std::exception &e )
    {
      const string err_msg = "ThreadPool destructor called with a pending exception: \""
                             + std::string(e.what()) + "\"";
      cerr << err_msg << endl;
#if( PERFORM_DEVELOPER_CHECKS )
      log_developer_error( __func__, err_msg.c_str() );
#endif
    }//try / catch
  }//~ThreadPool()


  void ThreadPool::join()
  {
#if( defined(ThreadPool_USING_THREADS) )
    if( m_nonPostedWorkers.size() )
    {
      // Clear the queue before running it, so work that throws during join
      //  is not run a second time from the destructor.
      vector< std::function<void(void)> > workers;
      workers.swap( m_nonPostedWorkers );
      do_asyncronous_work( workers, m_maxthreads );
    }
#endif

    std::lock_guard<std::mutex> lock( m_exception_mutex );
    if( m_exception )
    {
      std::exception_ptr the_exception = m_exception;
      m_exception = nullptr;
      std::rethrow_exception( the_exception );
    }
  }//void join()


  void ThreadPool::doworkasync( const std::function<void(void)> &fcn )
  {
    try
    {
      fcn();
    }catch( std::exception &e )
    {
      std::lock_guard<std::mutex> lock( m_exception_mutex );
      std::cerr << "ThreadPool::dowork caught: " << e.what() << std::endl;
      m_exception = std::current_exception();
    }
  }//void ThreadPool::doworkasync( const std::function< void(void) > &fcn )


  void ThreadPool::post( std::function<void(void)> worker )
  {
#if( defined(ThreadPool_USING_THREADS) )
    m_nonPostedWorkers.push_back( std::bind( &ThreadPool::doworkasync, this, worker ) );
#elif( defined(ThreadPool_USING_SERIAL) )
    doworkasync( worker );
#endif
  }//void ThreadPool::post( std::function<void(void)> fcn )
} //namespace IcpDatAsync
