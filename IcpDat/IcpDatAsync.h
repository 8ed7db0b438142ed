#ifndef IcpDatAsync_h
#define IcpDatAsync_h
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

#include <mutex>
#include <vector>
#include <exception>
#include <functional>

#if( IcpDat_USING_NO_THREADING )
#define ThreadPool_USING_SERIAL 1
#else
#define ThreadPool_USING_THREADS 1
#endif


namespace IcpDatAsync
{
  /** Number of threads the hardware can run at once; at least 1.  Always 1
   if built with IcpDat_USING_NO_THREADING.
   */
  int num_logical_cpu_cores();

  /** Runs all the workers, using up to maxthreads threads (zero means
   #num_logical_cpu_cores), and returns once they have all finished.

   Workers must not throw.
   */
  void do_asyncronous_work( std::vector< std::function<void(void)> > &workers,
                            const size_t maxthreads = 0 );


  /** A simple pool to run independent work items.

   Work is queued with #post, and is run when #join is called; if built with
   IcpDat_USING_NO_THREADING, work is run immediately by #post instead.
   Exceptions thrown by the work are caught, and the last one rethrown from
   #join.

   Example use:
   \code{.cpp}
   std::vector<int> results( inputs.size() );
   IcpDatAsync::ThreadPool pool;
   for( size_t i = 0; i < inputs.size(); ++i )
     pool.post( [i,&inputs,&results](){ results[i] = process( inputs[i] ); } );
   pool.join();
   \endcode
   */
  class ThreadPool
  {
  public:
    /** \param maxthreads Maximum number of threads to use; zero means
     #num_logical_cpu_cores.
     */
    explicit ThreadPool( const size_t maxthreads = 0 );

    /** Calls #join; an exception from the work at that point is reported to
     stderr, since it can not be propagated.
     */
    ~ThreadPool();

    /** Adds work to be run. */
    void post( std::function<void(void)> worker );

    /** Runs any queued work and blocks until it is done.  Rethrows the
     exception, if any, thrown by the work.
     */
    void join();

  protected:
    void doworkasync( const std::function<void(void)> &fcn );

    const size_t m_maxthreads;

    std::mutex m_exception_mutex;
    std::exception_ptr m_exception;

#if( defined(ThreadPool_USING_THREADS) )
    std::vector< std::function<void(void)> > m_nonPostedWorkers;
#endif
  };//class ThreadPool
}//namespace IcpDatAsync

#endif //IcpDatAsync_h
